#pragma once

#include <tally/schema/account.hpp>
#include <tally/schema/allocation.hpp>
#include <tally/schema/document_state.hpp>
#include <tally/schema/enum_string.hpp>
#include <tally/schema/ledger_entry.hpp>
#include <tally/schema/primitives.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Report derivations. Every function is a pure fold over records the caller
// loaded; nothing here touches storage.
namespace tally::reporting {

/// Restricts which accounts and entries a report sees.
struct report_filter final {
  // Only entries tagged with this department.
  std::optional<std::string> department;
  // Accounts with a security level above this are left out.
  uint32_t max_security_level{};
};

bool account_visible(const tally::schema::account_t& account,
                     const report_filter& filter);
bool entry_visible(const tally::schema::ledger_entry_t& entry,
                   const report_filter& filter);

struct account_line final {
  tally::schema::account_id_t account_id{};
  std::string code;
  std::string name;
  tally::schema::account_class_t classification{};
  tally::schema::amount_t debit{};
  tally::schema::amount_t credit{};
  // Signed by the classification's normal balance.
  tally::schema::amount_t balance{};
};

struct trial_balance final {
  std::vector<account_line> lines;
  tally::schema::amount_t total_debit{};
  tally::schema::amount_t total_credit{};

  bool balanced() const { return total_debit == total_credit; }
};

/// Net of each account over `start <= date <= end` (from the beginning of
/// the ledger without a start), shown in the debit or credit column. Accounts
/// that net to zero are omitted.
trial_balance make_trial_balance(
    const std::vector<tally::schema::account_t>& accounts,
    const std::vector<tally::schema::ledger_entry_t>& entries,
    const report_filter& filter,
    std::optional<tally::schema::date_t> start,
    tally::schema::date_t end);

struct profit_and_loss final {
  std::vector<account_line> income;
  std::vector<account_line> expenses;
  tally::schema::amount_t total_income{};
  tally::schema::amount_t total_expenses{};

  tally::schema::amount_t net_profit() const {
    return total_income - total_expenses;
  }
};

profit_and_loss make_profit_and_loss(
    const std::vector<tally::schema::account_t>& accounts,
    const std::vector<tally::schema::ledger_entry_t>& entries,
    const report_filter& filter,
    tally::schema::date_t start,
    tally::schema::date_t end);

struct balance_sheet final {
  std::vector<account_line> assets;
  std::vector<account_line> liabilities;
  std::vector<account_line> equity;
  // Cumulative income less expenses, reported within equity.
  tally::schema::amount_t current_earnings{};
  tally::schema::amount_t total_assets{};
  tally::schema::amount_t total_liabilities{};
  tally::schema::amount_t total_equity{};

  bool balanced() const {
    return total_assets == total_liabilities + total_equity;
  }
};

balance_sheet make_balance_sheet(
    const std::vector<tally::schema::account_t>& accounts,
    const std::vector<tally::schema::ledger_entry_t>& entries,
    const report_filter& filter,
    tally::schema::date_t as_of);

enum class aging_kind_t : uint8_t { receivable = 0, payable = 1 };

inline constexpr auto kAgingKindMappings = std::array{
    std::pair<std::string_view, aging_kind_t>{"receivable",
                                              aging_kind_t::receivable},
    std::pair<std::string_view, aging_kind_t>{"payable",
                                              aging_kind_t::payable}};

inline constexpr std::array<std::string_view, 5> kAgingBucketNames{
    "current", "1-30", "31-60", "61-90", "90+"};

using aging_buckets_t = std::array<tally::schema::amount_t, 5>;

/// Bucket index for a document `days_past_due` days after its due date.
std::size_t aging_bucket(int32_t days_past_due);

struct aging_row final {
  std::string contact;
  aging_buckets_t buckets{};
  tally::schema::amount_t total{};
};

struct aging_report final {
  aging_kind_t kind{aging_kind_t::receivable};
  tally::schema::date_t as_of{};
  std::vector<aging_row> rows;
  aging_buckets_t totals{};
  tally::schema::amount_t total{};
};

/// Open balances of posted sales invoices (receivable) or supplier bills
/// (payable) as of a date, per contact in name order. Allocations dated
/// after `as_of` and documents issued after it are ignored. With a
/// department filter only documents with a line in that department count.
aging_report make_aging(
    const std::vector<tally::schema::document_state_t>& documents,
    const std::vector<tally::schema::allocation_t>& allocations,
    aging_kind_t kind,
    tally::schema::date_t as_of,
    const report_filter& filter = {});

bool document_visible(const tally::schema::document_state_t& document,
                      const report_filter& filter);

struct cashflow_line final {
  tally::schema::account_id_t account_id{};
  std::string code;
  std::string name;
  tally::schema::amount_t opening{};
  tally::schema::amount_t inflow{};
  tally::schema::amount_t outflow{};
  tally::schema::amount_t closing{};
};

/// Movement of every visible bank account over `start <= date <= end`.
/// `entries` must include everything dated up to `end`.
std::vector<cashflow_line> make_cashflow(
    const std::vector<tally::schema::account_t>& accounts,
    const std::vector<tally::schema::ledger_entry_t>& entries,
    const report_filter& filter,
    tally::schema::date_t start,
    tally::schema::date_t end);

struct register_row final {
  tally::schema::ledger_entry_t entry;
  tally::schema::amount_t running_balance{};
};

struct bank_register final {
  tally::schema::amount_t opening_balance{};
  std::vector<register_row> rows;
  tally::schema::amount_t closing_balance{};
};

/// Register of one account over `start <= date <= end`, with balances in
/// debit-positive terms so that opening + debits - credits == closing.
/// `entries` are the account's entries dated up to `end`; entries outside the
/// filter's department are skipped.
bank_register make_bank_register(
    const std::vector<tally::schema::ledger_entry_t>& entries,
    const report_filter& filter,
    tally::schema::date_t start,
    tally::schema::date_t end);

}  // namespace tally::reporting
