#pragma once

#include <tally/execution/unit_of_work.hpp>
#include <tally/schema/account.hpp>
#include <tally/schema/allocation.hpp>
#include <tally/schema/bank_feed_item.hpp>
#include <tally/schema/bank_statement_import.hpp>
#include <tally/schema/company_settings.hpp>
#include <tally/schema/document_state.hpp>
#include <tally/schema/matching_rule.hpp>
#include <tally/schema/recurring_template.hpp>
#include <tally/schema/tax_code.hpp>
#include <tally/schema/transaction_state.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

// Typed record access over a unit of work. Records reference each other by
// id only; these functions resolve the ids.
namespace tally::execution {

using tally::schema::company_id_t;

/// Stored settings, or the defaults for a company never configured.
tally::schema::company_settings_t load_company_settings(
    const unit_of_work& work,
    const company_id_t& company_id);
void save_company_settings(unit_of_work& work,
                           const tally::schema::company_settings_t& settings);

std::optional<tally::schema::account_t> load_account(
    const unit_of_work& work,
    const company_id_t& company_id,
    const tally::schema::account_id_t& account_id);
std::optional<tally::schema::account_t> load_account_by_code(
    const unit_of_work& work,
    const company_id_t& company_id,
    std::string_view code);
std::vector<tally::schema::account_t> load_accounts(
    const unit_of_work& work,
    const company_id_t& company_id);
/// Store the account and keep the code index pointing at it.
void save_account(unit_of_work& work, const tally::schema::account_t& account);

std::optional<tally::schema::tax_code_t> load_tax_code(
    const unit_of_work& work,
    const company_id_t& company_id,
    std::string_view code);
void save_tax_code(unit_of_work& work,
                   const tally::schema::tax_code_t& tax_code);

std::optional<tally::schema::transaction_state_t> load_transaction(
    const unit_of_work& work,
    const company_id_t& company_id,
    const tally::schema::transaction_id_t& transaction_id);
void save_transaction(unit_of_work& work,
                      const tally::schema::transaction_state_t& transaction);

std::optional<tally::schema::document_state_t> load_document(
    const unit_of_work& work,
    const company_id_t& company_id,
    const tally::schema::document_id_t& document_id);
std::vector<tally::schema::document_state_t> load_documents(
    const unit_of_work& work,
    const company_id_t& company_id);
std::optional<tally::schema::document_id_t> find_document_by_number(
    const unit_of_work& work,
    const company_id_t& company_id,
    std::string_view number);
/// Optimistic write: succeeds only when `document.revision` equals the
/// revision currently visible to the unit of work, then bumps it. A new
/// document must carry revision 0.
[[nodiscard]] bool save_document(unit_of_work& work,
                                 tally::schema::document_state_t& document);

std::vector<tally::schema::allocation_t> load_allocations_for_document(
    const unit_of_work& work,
    const company_id_t& company_id,
    const tally::schema::document_id_t& document_id);
std::vector<tally::schema::allocation_t> load_allocations_for_source(
    const unit_of_work& work,
    const company_id_t& company_id,
    const tally::schema::transaction_id_t& source_transaction_id);
std::vector<tally::schema::allocation_t> load_allocations(
    const unit_of_work& work,
    const company_id_t& company_id);
std::optional<tally::schema::allocation_t> load_allocation(
    const unit_of_work& work,
    const company_id_t& company_id,
    const tally::schema::transaction_id_t& source_transaction_id,
    const tally::schema::document_id_t& document_id);
void save_allocation(unit_of_work& work,
                     const tally::schema::allocation_t& allocation);
void erase_allocation(unit_of_work& work,
                      const tally::schema::allocation_t& allocation);

/// Sum of the document's allocation rows.
tally::schema::amount_t allocated_to_document(
    const unit_of_work& work,
    const company_id_t& company_id,
    const tally::schema::document_id_t& document_id);

std::optional<tally::schema::bank_statement_import_t> load_statement_import(
    const unit_of_work& work,
    const company_id_t& company_id,
    const tally::schema::hash32_t& import_id);
std::optional<tally::schema::bank_feed_item_t> load_feed_item(
    const unit_of_work& work,
    const company_id_t& company_id,
    const tally::schema::hash32_t& import_id,
    std::string_view fit_id);
std::vector<tally::schema::bank_feed_item_t> load_feed_items(
    const unit_of_work& work,
    const company_id_t& company_id);
std::vector<tally::schema::bank_feed_item_t> load_feed_items_for_import(
    const unit_of_work& work,
    const company_id_t& company_id,
    const tally::schema::hash32_t& import_id);
void save_feed_item(unit_of_work& work,
                    const tally::schema::bank_feed_item_t& item);

/// (import id, fit id) of the feed item a transaction is matched to.
using feed_item_ref_t = std::tuple<tally::schema::hash32_t, std::string>;
std::optional<feed_item_ref_t> load_feed_match(
    const unit_of_work& work,
    const company_id_t& company_id,
    const tally::schema::transaction_id_t& transaction_id);
void erase_feed_match(unit_of_work& work,
                      const company_id_t& company_id,
                      const tally::schema::transaction_id_t& transaction_id);

std::vector<tally::schema::matching_rule_t> load_matching_rules(
    const unit_of_work& work,
    const company_id_t& company_id);

std::optional<tally::schema::recurring_template_t> load_recurring_template(
    const unit_of_work& work,
    const company_id_t& company_id,
    const tally::schema::hash32_t& template_id);
std::vector<tally::schema::recurring_template_t> load_recurring_templates(
    const unit_of_work& work,
    const company_id_t& company_id);

}  // namespace tally::execution
