#pragma once
#include <tally/schema/primitives.hpp>
#include <tally/schema/transaction_line.hpp>
#include <tally/schema/transaction_type.hpp>
#include <optional>
#include <string>
#include <vector>

namespace tally::schema {

template <uint16_t Version>
struct create_transaction;

template <>
struct create_transaction<1> final {
  uint16_t version{1};
  transaction_id_t transaction_id{};
  transaction_type_t type{transaction_type_t::journal};
  date_t date{};
  std::optional<std::string> reference;
  std::optional<std::string> description;
  std::vector<transaction_line_t> lines;
};

using create_transaction_t = create_transaction<1>;

}  // namespace tally::schema
