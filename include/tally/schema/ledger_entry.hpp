#pragma once
#include <tally/schema/primitives.hpp>
#include <optional>
#include <string>

namespace tally::schema {

template <uint16_t Version>
struct ledger_entry;

// Immutable. Exactly one of amount_dr and amount_cr is non-zero.
template <>
struct ledger_entry<1> final {
  uint16_t version{1};
  company_id_t company_id{};
  uint64_t sequence{};
  account_id_t account_id{};
  transaction_id_t transaction_id{};
  date_t entry_date{};
  amount_t amount_dr{};
  amount_t amount_cr{};
  std::optional<std::string> department;
  std::optional<std::string> memo;
};

using ledger_entry_t = ledger_entry<1>;

}  // namespace tally::schema
