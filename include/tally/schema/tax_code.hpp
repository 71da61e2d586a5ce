#pragma once
#include <tally/schema/primitives.hpp>
#include <string>

namespace tally::schema {

template <uint16_t Version>
struct tax_code;

template <>
struct tax_code<1> final {
  uint16_t version{1};
  company_id_t company_id{};
  std::string code;
  std::string name;
  uint32_t rate_basis_points{};
  bool active{true};
};

using tax_code_t = tax_code<1>;

}  // namespace tally::schema
