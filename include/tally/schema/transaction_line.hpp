#pragma once
#include <tally/schema/direction.hpp>
#include <tally/schema/primitives.hpp>
#include <optional>
#include <string>

namespace tally::schema {

template <uint16_t Version>
struct transaction_line;

template <>
struct transaction_line<1> final {
  uint16_t version{1};
  account_id_t account_id{};
  amount_t amount{};
  direction_t direction{direction_t::debit};
  // Annotation only; rates are applied by callers before posting.
  std::optional<std::string> tax_code;
  std::optional<std::string> department;
  std::optional<std::string> memo;
};

using transaction_line_t = transaction_line<1>;

}  // namespace tally::schema
