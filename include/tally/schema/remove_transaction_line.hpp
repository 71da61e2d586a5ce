#pragma once
#include <tally/schema/primitives.hpp>

namespace tally::schema {

template <uint16_t Version>
struct remove_transaction_line;

template <>
struct remove_transaction_line<1> final {
  uint16_t version{1};
  transaction_id_t transaction_id{};
  uint32_t line_index{};
};

using remove_transaction_line_t = remove_transaction_line<1>;

}  // namespace tally::schema
