#pragma once

#include <tally/schema/primitives.hpp>
#include <cstdint>
#include <string_view>

// Key layout of the ledger database. Every key starts with a keyspace prefix
// followed by the 32-byte company id, so a company's records form one
// contiguous range per keyspace.
namespace tally::schema::key {

inline constexpr std::string_view kCompanyKeyPrefix{"STATE|COMPANY|"};
inline constexpr std::string_view kAccountKeyPrefix{"STATE|ACCOUNT|"};
inline constexpr std::string_view kAccountCodeKeyPrefix{"STATE|ACCOUNT_CODE|"};
inline constexpr std::string_view kTaxCodeKeyPrefix{"STATE|TAX_CODE|"};
inline constexpr std::string_view kTransactionKeyPrefix{"STATE|TXN|"};
inline constexpr std::string_view kDocumentKeyPrefix{"STATE|DOC|"};
inline constexpr std::string_view kDocumentNumberKeyPrefix{"STATE|DOC_NUMBER|"};
inline constexpr std::string_view kAllocationKeyPrefix{"STATE|ALLOC|"};
inline constexpr std::string_view kSourceAllocationKeyPrefix{
    "STATE|SRC_ALLOC|"};
inline constexpr std::string_view kStatementImportKeyPrefix{
    "STATE|FEED_IMPORT|"};
inline constexpr std::string_view kStatementHashKeyPrefix{"STATE|FEED_HASH|"};
inline constexpr std::string_view kFeedItemKeyPrefix{"STATE|FEED_ITEM|"};
inline constexpr std::string_view kFeedMatchKeyPrefix{"STATE|FEED_MATCH|"};
inline constexpr std::string_view kMatchingRuleKeyPrefix{"STATE|RULE|"};
inline constexpr std::string_view kRecurringTemplateKeyPrefix{
    "STATE|TEMPLATE|"};
inline constexpr std::string_view kLedgerSequenceKeyPrefix{"LEDGER|SEQ|"};
inline constexpr std::string_view kLedgerEntryKeyPrefix{"LEDGER|ENTRY|"};
inline constexpr std::string_view kAccountLedgerKeyPrefix{"LEDGER|ACCOUNT|"};
inline constexpr std::string_view kAuditSequenceKeyPrefix{"AUDIT|SEQ|"};
inline constexpr std::string_view kAuditEventKeyPrefix{"AUDIT|EVENT|"};

/// Map a signed date onto an unsigned value with the same ordering.
inline constexpr uint32_t ordered_date(const date_t date) {
  return static_cast<uint32_t>(date) ^ 0x80000000u;
}

/// `prefix | company`: range of all company records in a keyspace.
bytes_t make_company_prefix(std::string_view prefix,
                            const company_id_t& company_id);

bytes_t make_company_settings_key(const company_id_t& company_id);
bytes_t make_account_key(const company_id_t& company_id,
                         const account_id_t& account_id);
bytes_t make_account_code_key(const company_id_t& company_id,
                              std::string_view code);
bytes_t make_tax_code_key(const company_id_t& company_id,
                          std::string_view code);
bytes_t make_transaction_key(const company_id_t& company_id,
                             const transaction_id_t& transaction_id);
bytes_t make_document_key(const company_id_t& company_id,
                          const document_id_t& document_id);
bytes_t make_document_number_key(const company_id_t& company_id,
                                 std::string_view number);

/// Allocation row keyed by document first, for balance recomputation.
bytes_t make_allocation_key(const company_id_t& company_id,
                            const document_id_t& document_id,
                            const transaction_id_t& source_transaction_id);
bytes_t make_allocation_prefix(const company_id_t& company_id,
                               const document_id_t& document_id);
/// Mirror of the allocation row keyed by source transaction first.
bytes_t make_source_allocation_key(
    const company_id_t& company_id,
    const transaction_id_t& source_transaction_id,
    const document_id_t& document_id);
bytes_t make_source_allocation_prefix(
    const company_id_t& company_id,
    const transaction_id_t& source_transaction_id);

bytes_t make_statement_import_key(const company_id_t& company_id,
                                  const hash32_t& import_id);
bytes_t make_statement_hash_key(const company_id_t& company_id,
                                const account_id_t& bank_account_id,
                                const hash32_t& file_hash);
bytes_t make_feed_item_key(const company_id_t& company_id,
                           const hash32_t& import_id,
                           std::string_view fit_id);
bytes_t make_feed_item_prefix(const company_id_t& company_id,
                              const hash32_t& import_id);
bytes_t make_feed_match_key(const company_id_t& company_id,
                            const transaction_id_t& transaction_id);

bytes_t make_matching_rule_key(const company_id_t& company_id,
                               const hash32_t& rule_id);
bytes_t make_recurring_template_key(const company_id_t& company_id,
                                    const hash32_t& template_id);

bytes_t make_ledger_sequence_key(const company_id_t& company_id);
bytes_t make_ledger_entry_key(const company_id_t& company_id,
                              date_t entry_date,
                              uint64_t sequence);
bytes_t make_account_ledger_key(const company_id_t& company_id,
                                const account_id_t& account_id,
                                date_t entry_date,
                                uint64_t sequence);
bytes_t make_account_ledger_prefix(const company_id_t& company_id,
                                   const account_id_t& account_id);

bytes_t make_audit_sequence_key(const company_id_t& company_id);
bytes_t make_audit_event_key(const company_id_t& company_id,
                             timestamp_milliseconds_t recorded_at,
                             uint64_t sequence);

/// Ids the engine derives for records it creates on the caller's behalf.
hash32_t make_reversal_id(const transaction_id_t& transaction_id);
hash32_t make_document_transaction_id(const document_id_t& document_id);
hash32_t make_feed_transaction_id(const hash32_t& import_id,
                                  std::string_view fit_id,
                                  uint32_t coding);
hash32_t make_recurring_transaction_id(const hash32_t& template_id,
                                       date_t run_date);

}  // namespace tally::schema::key
