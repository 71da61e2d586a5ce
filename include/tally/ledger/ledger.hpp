#pragma once

#include <tally/execution/unit_of_work.hpp>
#include <tally/schema/account.hpp>
#include <tally/schema/ledger_entry.hpp>
#include <tally/schema/primitives.hpp>
#include <tally/schema/transaction_state.hpp>
#include <optional>
#include <vector>

// Append-only ledger store. Entries are written only by posting and are
// never updated or deleted. Balances are always summed from entries.
namespace tally::ledger {

/// Debit and credit totals of a set of entries.
struct movement final {
  tally::schema::amount_t debit{};
  tally::schema::amount_t credit{};

  tally::schema::amount_t net() const { return debit - credit; }
};

movement sum(const std::vector<tally::schema::ledger_entry_t>& entries);

/// Stage one entry per line of `transaction`, dated at the transaction date,
/// under fresh per-company sequence numbers. Returns the sequences in line
/// order.
std::vector<uint64_t> append_entries(
    tally::execution::unit_of_work& work,
    const tally::schema::transaction_state_t& transaction);

/// Entries a posted transaction produced, in line order.
std::vector<tally::schema::ledger_entry_t> entries_for_transaction(
    const tally::execution::unit_of_work& work,
    const tally::schema::transaction_state_t& transaction);

/// Display-signed balance of the account over entries dated on or before
/// `as_of`. Returns std::nullopt for an unknown account.
std::optional<tally::schema::amount_t> balance_as_of(
    const tally::execution::unit_of_work& work,
    const tally::schema::company_id_t& company_id,
    const tally::schema::account_id_t& account_id,
    tally::schema::date_t as_of);

tally::schema::amount_t balance_as_of(
    const tally::execution::unit_of_work& work,
    const tally::schema::account_t& account,
    tally::schema::date_t as_of);

/// Entries of one account with start <= date <= end, ordered by
/// (date, sequence).
std::vector<tally::schema::ledger_entry_t> entries_in_range(
    const tally::execution::unit_of_work& work,
    const tally::schema::company_id_t& company_id,
    const tally::schema::account_id_t& account_id,
    tally::schema::date_t start,
    tally::schema::date_t end);

/// Entries of every account of the company with start <= date <= end,
/// ordered by (date, sequence).
std::vector<tally::schema::ledger_entry_t> entries_in_range(
    const tally::execution::unit_of_work& work,
    const tally::schema::company_id_t& company_id,
    tally::schema::date_t start,
    tally::schema::date_t end);

}  // namespace tally::ledger
