#pragma once
#include <tally/schema/primitives.hpp>
#include <tally/schema/transaction_line.hpp>

namespace tally::schema {

template <uint16_t Version>
struct add_transaction_line;

template <>
struct add_transaction_line<1> final {
  uint16_t version{1};
  transaction_id_t transaction_id{};
  transaction_line_t line;
};

using add_transaction_line_t = add_transaction_line<1>;

}  // namespace tally::schema
