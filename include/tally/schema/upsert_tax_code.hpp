#pragma once
#include <tally/schema/primitives.hpp>
#include <string>

namespace tally::schema {

template <uint16_t Version>
struct upsert_tax_code;

template <>
struct upsert_tax_code<1> final {
  uint16_t version{1};
  std::string code;
  std::string name;
  uint32_t rate_basis_points{};
  bool active{true};
};

using upsert_tax_code_t = upsert_tax_code<1>;

}  // namespace tally::schema
