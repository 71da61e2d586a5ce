#pragma once
#include <tally/schema/posting_status.hpp>
#include <tally/schema/primitives.hpp>
#include <tally/schema/transaction_line.hpp>
#include <tally/schema/transaction_type.hpp>
#include <optional>
#include <string>
#include <vector>

namespace tally::schema {

template <uint16_t Version>
struct transaction_state;

template <>
struct transaction_state<1> final {
  uint16_t version{1};
  company_id_t company_id{};
  transaction_id_t transaction_id{};
  transaction_type_t type{transaction_type_t::journal};
  posting_status_t status{posting_status_t::draft};
  date_t date{};
  std::optional<std::string> reference;
  std::optional<std::string> description;
  std::vector<transaction_line_t> lines;
  // Ledger sequences written by posting, in line order.
  std::vector<uint64_t> entry_sequences;
  std::optional<timestamp_milliseconds_t> posted_at;
  std::optional<transaction_id_t> reversal_of;
  std::optional<transaction_id_t> reversed_by;
  std::optional<document_id_t> source_document_id;
  std::optional<std::string> void_reason;
};

using transaction_state_t = transaction_state<1>;

inline amount_t total_debits(const transaction_state_t& transaction) {
  auto total = amount_t{};
  for (const auto& line : transaction.lines) {
    if (line.direction == direction_t::debit) {
      total += line.amount;
    }
  }
  return total;
}

inline amount_t total_credits(const transaction_state_t& transaction) {
  auto total = amount_t{};
  for (const auto& line : transaction.lines) {
    if (line.direction == direction_t::credit) {
      total += line.amount;
    }
  }
  return total;
}

}  // namespace tally::schema
