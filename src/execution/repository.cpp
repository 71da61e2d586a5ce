#include <tally/execution/repository.hpp>
#include <tally/schema/key/keys.hpp>

using namespace tally::schema;

namespace tally::execution {

namespace {

bytes_view_t view(const bytes_t& bytes) {
  return bytes_view_t{bytes.data(), bytes.size()};
}

}  // namespace

company_settings_t load_company_settings(const unit_of_work& work,
                                         const company_id_t& company_id) {
  auto settings = work.get<company_settings_t>(
      view(key::make_company_settings_key(company_id)));
  if (settings) {
    return *settings;
  }
  auto defaults = company_settings_t{};
  defaults.company_id = company_id;
  return defaults;
}

void save_company_settings(unit_of_work& work,
                           const company_settings_t& settings) {
  work.put(view(key::make_company_settings_key(settings.company_id)),
           settings);
}

std::optional<account_t> load_account(const unit_of_work& work,
                                      const company_id_t& company_id,
                                      const account_id_t& account_id) {
  return work.get<account_t>(
      view(key::make_account_key(company_id, account_id)));
}

std::optional<account_t> load_account_by_code(const unit_of_work& work,
                                              const company_id_t& company_id,
                                              std::string_view code) {
  auto account_id = work.get<account_id_t>(
      view(key::make_account_code_key(company_id, code)));
  if (!account_id) {
    return std::nullopt;
  }
  return load_account(work, company_id, *account_id);
}

std::vector<account_t> load_accounts(const unit_of_work& work,
                                     const company_id_t& company_id) {
  return work.list<account_t>(
      view(key::make_company_prefix(key::kAccountKeyPrefix, company_id)));
}

void save_account(unit_of_work& work, const account_t& account) {
  auto existing = load_account(work, account.company_id, account.account_id);
  if (existing && existing->code != account.code) {
    work.erase(
        view(key::make_account_code_key(account.company_id, existing->code)));
  }
  work.put(view(key::make_account_key(account.company_id, account.account_id)),
           account);
  work.put(view(key::make_account_code_key(account.company_id, account.code)),
           account.account_id);
}

std::optional<tax_code_t> load_tax_code(const unit_of_work& work,
                                        const company_id_t& company_id,
                                        std::string_view code) {
  return work.get<tax_code_t>(view(key::make_tax_code_key(company_id, code)));
}

void save_tax_code(unit_of_work& work, const tax_code_t& tax_code) {
  work.put(view(key::make_tax_code_key(tax_code.company_id, tax_code.code)),
           tax_code);
}

std::optional<transaction_state_t> load_transaction(
    const unit_of_work& work,
    const company_id_t& company_id,
    const transaction_id_t& transaction_id) {
  return work.get<transaction_state_t>(
      view(key::make_transaction_key(company_id, transaction_id)));
}

void save_transaction(unit_of_work& work,
                      const transaction_state_t& transaction) {
  work.put(view(key::make_transaction_key(transaction.company_id,
                                          transaction.transaction_id)),
           transaction);
}

std::optional<document_state_t> load_document(const unit_of_work& work,
                                              const company_id_t& company_id,
                                              const document_id_t& document_id) {
  return work.get<document_state_t>(
      view(key::make_document_key(company_id, document_id)));
}

std::vector<document_state_t> load_documents(const unit_of_work& work,
                                             const company_id_t& company_id) {
  return work.list<document_state_t>(
      view(key::make_company_prefix(key::kDocumentKeyPrefix, company_id)));
}

std::optional<document_id_t> find_document_by_number(
    const unit_of_work& work,
    const company_id_t& company_id,
    std::string_view number) {
  return work.get<document_id_t>(
      view(key::make_document_number_key(company_id, number)));
}

bool save_document(unit_of_work& work, document_state_t& document) {
  auto current = load_document(work, document.company_id, document.document_id);
  auto expected = current ? current->revision : uint64_t{0};
  if (document.revision != expected) {
    return false;
  }
  if (!current || current->number != document.number) {
    if (current) {
      work.erase(view(
          key::make_document_number_key(document.company_id, current->number)));
    }
    work.put(view(key::make_document_number_key(document.company_id,
                                                 document.number)),
             document.document_id);
  }
  document.revision = expected + 1;
  work.put(view(key::make_document_key(document.company_id,
                                       document.document_id)),
           document);
  return true;
}

std::vector<allocation_t> load_allocations_for_document(
    const unit_of_work& work,
    const company_id_t& company_id,
    const document_id_t& document_id) {
  return work.list<allocation_t>(
      view(key::make_allocation_prefix(company_id, document_id)));
}

std::vector<allocation_t> load_allocations_for_source(
    const unit_of_work& work,
    const company_id_t& company_id,
    const transaction_id_t& source_transaction_id) {
  return work.list<allocation_t>(
      view(key::make_source_allocation_prefix(company_id,
                                              source_transaction_id)));
}

std::vector<allocation_t> load_allocations(const unit_of_work& work,
                                           const company_id_t& company_id) {
  return work.list<allocation_t>(
      view(key::make_company_prefix(key::kAllocationKeyPrefix, company_id)));
}

std::optional<allocation_t> load_allocation(
    const unit_of_work& work,
    const company_id_t& company_id,
    const transaction_id_t& source_transaction_id,
    const document_id_t& document_id) {
  return work.get<allocation_t>(view(
      key::make_allocation_key(company_id, document_id, source_transaction_id)));
}

void save_allocation(unit_of_work& work, const allocation_t& allocation) {
  work.put(view(key::make_allocation_key(allocation.company_id,
                                         allocation.document_id,
                                         allocation.source_transaction_id)),
           allocation);
  work.put(view(key::make_source_allocation_key(
               allocation.company_id, allocation.source_transaction_id,
               allocation.document_id)),
           allocation);
}

void erase_allocation(unit_of_work& work, const allocation_t& allocation) {
  work.erase(view(key::make_allocation_key(allocation.company_id,
                                           allocation.document_id,
                                           allocation.source_transaction_id)));
  work.erase(view(key::make_source_allocation_key(
      allocation.company_id, allocation.source_transaction_id,
      allocation.document_id)));
}

amount_t allocated_to_document(const unit_of_work& work,
                               const company_id_t& company_id,
                               const document_id_t& document_id) {
  auto allocated = amount_t{};
  for (const auto& allocation :
       load_allocations_for_document(work, company_id, document_id)) {
    allocated += allocation.amount;
  }
  return allocated;
}

std::optional<bank_statement_import_t> load_statement_import(
    const unit_of_work& work,
    const company_id_t& company_id,
    const hash32_t& import_id) {
  return work.get<bank_statement_import_t>(
      view(key::make_statement_import_key(company_id, import_id)));
}

std::optional<bank_feed_item_t> load_feed_item(const unit_of_work& work,
                                               const company_id_t& company_id,
                                               const hash32_t& import_id,
                                               std::string_view fit_id) {
  return work.get<bank_feed_item_t>(
      view(key::make_feed_item_key(company_id, import_id, fit_id)));
}

std::vector<bank_feed_item_t> load_feed_items(const unit_of_work& work,
                                              const company_id_t& company_id) {
  return work.list<bank_feed_item_t>(
      view(key::make_company_prefix(key::kFeedItemKeyPrefix, company_id)));
}

std::vector<bank_feed_item_t> load_feed_items_for_import(
    const unit_of_work& work,
    const company_id_t& company_id,
    const hash32_t& import_id) {
  return work.list<bank_feed_item_t>(
      view(key::make_feed_item_prefix(company_id, import_id)));
}

void save_feed_item(unit_of_work& work, const bank_feed_item_t& item) {
  work.put(view(key::make_feed_item_key(item.company_id, item.import_id,
                                        item.fit_id)),
           item);
  if (item.matched_transaction_id) {
    work.put(view(key::make_feed_match_key(item.company_id,
                                           *item.matched_transaction_id)),
             feed_item_ref_t{item.import_id, item.fit_id});
  }
}

std::optional<feed_item_ref_t> load_feed_match(
    const unit_of_work& work,
    const company_id_t& company_id,
    const transaction_id_t& transaction_id) {
  return work.get<feed_item_ref_t>(
      view(key::make_feed_match_key(company_id, transaction_id)));
}

void erase_feed_match(unit_of_work& work,
                      const company_id_t& company_id,
                      const transaction_id_t& transaction_id) {
  work.erase(view(key::make_feed_match_key(company_id, transaction_id)));
}

std::vector<matching_rule_t> load_matching_rules(
    const unit_of_work& work,
    const company_id_t& company_id) {
  return work.list<matching_rule_t>(
      view(key::make_company_prefix(key::kMatchingRuleKeyPrefix, company_id)));
}

std::optional<recurring_template_t> load_recurring_template(
    const unit_of_work& work,
    const company_id_t& company_id,
    const hash32_t& template_id) {
  return work.get<recurring_template_t>(
      view(key::make_recurring_template_key(company_id, template_id)));
}

std::vector<recurring_template_t> load_recurring_templates(
    const unit_of_work& work,
    const company_id_t& company_id) {
  return work.list<recurring_template_t>(view(
      key::make_company_prefix(key::kRecurringTemplateKeyPrefix, company_id)));
}

}  // namespace tally::execution
