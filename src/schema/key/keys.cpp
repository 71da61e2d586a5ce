#include <tally/blake3/hash.hpp>
#include <tally/schema/key/builder.hpp>
#include <tally/schema/key/keys.hpp>
#include <utility>

namespace tally::schema::key {

namespace {

builder company_key(std::string_view prefix, const company_id_t& company_id) {
  auto key = builder{};
  key.write(prefix).write(company_id);
  return key;
}

hash32_t derive_id(const std::string_view context, builder&& material) {
  return tally::blake3::derive(
      context, bytes_view_t{material.data.data(), material.data.size()});
}

}  // namespace

bytes_t make_company_prefix(std::string_view prefix,
                            const company_id_t& company_id) {
  return company_key(prefix, company_id).data;
}

bytes_t make_company_settings_key(const company_id_t& company_id) {
  return company_key(kCompanyKeyPrefix, company_id).data;
}

bytes_t make_account_key(const company_id_t& company_id,
                         const account_id_t& account_id) {
  return company_key(kAccountKeyPrefix, company_id).write(account_id).data;
}

bytes_t make_account_code_key(const company_id_t& company_id,
                              std::string_view code) {
  return company_key(kAccountCodeKeyPrefix, company_id).write(code).data;
}

bytes_t make_tax_code_key(const company_id_t& company_id,
                          std::string_view code) {
  return company_key(kTaxCodeKeyPrefix, company_id).write(code).data;
}

bytes_t make_transaction_key(const company_id_t& company_id,
                             const transaction_id_t& transaction_id) {
  return company_key(kTransactionKeyPrefix, company_id)
      .write(transaction_id)
      .data;
}

bytes_t make_document_key(const company_id_t& company_id,
                          const document_id_t& document_id) {
  return company_key(kDocumentKeyPrefix, company_id).write(document_id).data;
}

bytes_t make_document_number_key(const company_id_t& company_id,
                                 std::string_view number) {
  return company_key(kDocumentNumberKeyPrefix, company_id).write(number).data;
}

bytes_t make_allocation_key(const company_id_t& company_id,
                            const document_id_t& document_id,
                            const transaction_id_t& source_transaction_id) {
  return company_key(kAllocationKeyPrefix, company_id)
      .write(document_id)
      .write(source_transaction_id)
      .data;
}

bytes_t make_allocation_prefix(const company_id_t& company_id,
                               const document_id_t& document_id) {
  return company_key(kAllocationKeyPrefix, company_id).write(document_id).data;
}

bytes_t make_source_allocation_key(
    const company_id_t& company_id,
    const transaction_id_t& source_transaction_id,
    const document_id_t& document_id) {
  return company_key(kSourceAllocationKeyPrefix, company_id)
      .write(source_transaction_id)
      .write(document_id)
      .data;
}

bytes_t make_source_allocation_prefix(
    const company_id_t& company_id,
    const transaction_id_t& source_transaction_id) {
  return company_key(kSourceAllocationKeyPrefix, company_id)
      .write(source_transaction_id)
      .data;
}

bytes_t make_statement_import_key(const company_id_t& company_id,
                                  const hash32_t& import_id) {
  return company_key(kStatementImportKeyPrefix, company_id)
      .write(import_id)
      .data;
}

bytes_t make_statement_hash_key(const company_id_t& company_id,
                                const account_id_t& bank_account_id,
                                const hash32_t& file_hash) {
  return company_key(kStatementHashKeyPrefix, company_id)
      .write(bank_account_id)
      .write(file_hash)
      .data;
}

bytes_t make_feed_item_key(const company_id_t& company_id,
                           const hash32_t& import_id,
                           std::string_view fit_id) {
  return company_key(kFeedItemKeyPrefix, company_id)
      .write(import_id)
      .hash(fit_id)
      .data;
}

bytes_t make_feed_item_prefix(const company_id_t& company_id,
                              const hash32_t& import_id) {
  return company_key(kFeedItemKeyPrefix, company_id).write(import_id).data;
}

bytes_t make_feed_match_key(const company_id_t& company_id,
                            const transaction_id_t& transaction_id) {
  return company_key(kFeedMatchKeyPrefix, company_id)
      .write(transaction_id)
      .data;
}

bytes_t make_matching_rule_key(const company_id_t& company_id,
                               const hash32_t& rule_id) {
  return company_key(kMatchingRuleKeyPrefix, company_id).write(rule_id).data;
}

bytes_t make_recurring_template_key(const company_id_t& company_id,
                                    const hash32_t& template_id) {
  return company_key(kRecurringTemplateKeyPrefix, company_id)
      .write(template_id)
      .data;
}

bytes_t make_ledger_sequence_key(const company_id_t& company_id) {
  return company_key(kLedgerSequenceKeyPrefix, company_id).data;
}

bytes_t make_ledger_entry_key(const company_id_t& company_id,
                              const date_t entry_date,
                              const uint64_t sequence) {
  return company_key(kLedgerEntryKeyPrefix, company_id)
      .write_date(entry_date)
      .write(sequence)
      .data;
}

bytes_t make_account_ledger_key(const company_id_t& company_id,
                                const account_id_t& account_id,
                                const date_t entry_date,
                                const uint64_t sequence) {
  return company_key(kAccountLedgerKeyPrefix, company_id)
      .write(account_id)
      .write_date(entry_date)
      .write(sequence)
      .data;
}

bytes_t make_account_ledger_prefix(const company_id_t& company_id,
                                   const account_id_t& account_id) {
  return company_key(kAccountLedgerKeyPrefix, company_id)
      .write(account_id)
      .data;
}

bytes_t make_audit_sequence_key(const company_id_t& company_id) {
  return company_key(kAuditSequenceKeyPrefix, company_id).data;
}

bytes_t make_audit_event_key(const company_id_t& company_id,
                             const timestamp_milliseconds_t recorded_at,
                             const uint64_t sequence) {
  return company_key(kAuditEventKeyPrefix, company_id)
      .write(recorded_at)
      .write(sequence)
      .data;
}

hash32_t make_reversal_id(const transaction_id_t& transaction_id) {
  auto material = builder{};
  material.write(transaction_id);
  return derive_id("tally 2024 reversal transaction id", std::move(material));
}

hash32_t make_document_transaction_id(const document_id_t& document_id) {
  auto material = builder{};
  material.write(document_id);
  return derive_id("tally 2024 document transaction id", std::move(material));
}

hash32_t make_feed_transaction_id(const hash32_t& import_id,
                                  std::string_view fit_id,
                                  const uint32_t coding) {
  auto material = builder{};
  material.write(import_id).hash(fit_id).write(coding);
  return derive_id("tally 2024 feed transaction id", std::move(material));
}

hash32_t make_recurring_transaction_id(const hash32_t& template_id,
                                       const date_t run_date) {
  auto material = builder{};
  material.write(template_id).write_date(run_date);
  return derive_id("tally 2024 recurring transaction id", std::move(material));
}

}  // namespace tally::schema::key
