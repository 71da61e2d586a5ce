#include <tally/ledger/ledger.hpp>
#include <tally/common/critical.hpp>
#include <tally/execution/repository.hpp>
#include <tally/schema/key/keys.hpp>
#include <algorithm>

using namespace tally::schema;

namespace tally::ledger {

namespace {

std::vector<ledger_entry_t> filter_dates(std::vector<ledger_entry_t> entries,
                                         const date_t start,
                                         const date_t end) {
  std::erase_if(entries, [&](const ledger_entry_t& entry) {
    return entry.entry_date < start || entry.entry_date > end;
  });
  return entries;
}

}  // namespace

movement sum(const std::vector<ledger_entry_t>& entries) {
  auto total = movement{};
  for (const auto& entry : entries) {
    total.debit += entry.amount_dr;
    total.credit += entry.amount_cr;
  }
  return total;
}

std::vector<uint64_t> append_entries(
    tally::execution::unit_of_work& work,
    const transaction_state_t& transaction) {
  auto sequence_key = key::make_ledger_sequence_key(transaction.company_id);
  auto next = work.get<uint64_t>(sequence_key).value_or(1);

  auto sequences = std::vector<uint64_t>{};
  sequences.reserve(transaction.lines.size());
  for (const auto& line : transaction.lines) {
    auto entry = ledger_entry_t{};
    entry.company_id = transaction.company_id;
    entry.sequence = next++;
    entry.account_id = line.account_id;
    entry.transaction_id = transaction.transaction_id;
    entry.entry_date = transaction.date;
    if (line.direction == direction_t::debit) {
      entry.amount_dr = line.amount;
    } else {
      entry.amount_cr = line.amount;
    }
    entry.department = line.department;
    entry.memo = line.memo;

    work.put(key::make_ledger_entry_key(entry.company_id, entry.entry_date,
                                        entry.sequence),
             entry);
    work.put(key::make_account_ledger_key(entry.company_id, entry.account_id,
                                          entry.entry_date, entry.sequence),
             entry);
    sequences.push_back(entry.sequence);
  }
  work.put(sequence_key, next);
  return sequences;
}

std::vector<ledger_entry_t> entries_for_transaction(
    const tally::execution::unit_of_work& work,
    const transaction_state_t& transaction) {
  auto entries = std::vector<ledger_entry_t>{};
  entries.reserve(transaction.entry_sequences.size());
  for (const auto sequence : transaction.entry_sequences) {
    auto entry = work.get<ledger_entry_t>(key::make_ledger_entry_key(
        transaction.company_id, transaction.date, sequence));
    if (!entry) {
      tally::common::critical("posted transaction references a missing entry");
    }
    entries.push_back(std::move(*entry));
  }
  return entries;
}

std::optional<amount_t> balance_as_of(const tally::execution::unit_of_work& work,
                                      const company_id_t& company_id,
                                      const account_id_t& account_id,
                                      const date_t as_of) {
  auto account = tally::execution::load_account(work, company_id, account_id);
  if (!account) {
    return std::nullopt;
  }
  return balance_as_of(work, *account, as_of);
}

amount_t balance_as_of(const tally::execution::unit_of_work& work,
                       const account_t& account,
                       const date_t as_of) {
  auto entries = work.list<ledger_entry_t>(
      key::make_account_ledger_prefix(account.company_id, account.account_id));
  auto total = movement{};
  for (const auto& entry : entries) {
    if (entry.entry_date > as_of) {
      break;
    }
    total.debit += entry.amount_dr;
    total.credit += entry.amount_cr;
  }
  return signed_balance(account.classification, total.debit, total.credit);
}

std::vector<ledger_entry_t> entries_in_range(
    const tally::execution::unit_of_work& work,
    const company_id_t& company_id,
    const account_id_t& account_id,
    const date_t start,
    const date_t end) {
  return filter_dates(
      work.list<ledger_entry_t>(
          key::make_account_ledger_prefix(company_id, account_id)),
      start, end);
}

std::vector<ledger_entry_t> entries_in_range(
    const tally::execution::unit_of_work& work,
    const company_id_t& company_id,
    const date_t start,
    const date_t end) {
  return filter_dates(
      work.list<ledger_entry_t>(
          key::make_company_prefix(key::kLedgerEntryKeyPrefix, company_id)),
      start, end);
}

}  // namespace tally::ledger
