#pragma once
#include <tally/schema/primitives.hpp>
#include <optional>
#include <string>

namespace tally::schema {

template <uint16_t Version>
struct document_line;

template <>
struct document_line<1> final {
  uint16_t version{1};
  account_id_t account_id{};
  std::string description;
  amount_t net_amount{};
  amount_t tax_amount{};
  std::optional<std::string> tax_code;
  std::optional<uint32_t> tax_rate_basis_points;
  std::optional<std::string> department;
};

using document_line_t = document_line<1>;

}  // namespace tally::schema
