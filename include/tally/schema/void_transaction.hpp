#pragma once
#include <tally/schema/primitives.hpp>
#include <optional>
#include <string>

namespace tally::schema {

template <uint16_t Version>
struct void_transaction;

template <>
struct void_transaction<1> final {
  uint16_t version{1};
  transaction_id_t transaction_id{};
  std::string reason;
  // Defaults to the original transaction date.
  std::optional<date_t> reversal_date;
  // Remove allocations sourced from the transaction instead of refusing.
  bool release_allocations{};
};

using void_transaction_t = void_transaction<1>;

}  // namespace tally::schema
