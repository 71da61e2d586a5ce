#pragma once
#include <tally/schema/account_class.hpp>
#include <tally/schema/primitives.hpp>
#include <optional>
#include <string>

namespace tally::schema {

template <uint16_t Version>
struct account;

template <>
struct account<1> final {
  uint16_t version{1};
  company_id_t company_id{};
  account_id_t account_id{};
  std::string code;
  std::string name;
  account_class_t classification{account_class_t::asset};
  bool active{true};
  std::optional<account_id_t> parent_id;
  // Accounts with a level above a reader's clearance are left out of reports.
  std::optional<uint32_t> security_level;
  bool is_bank{};
};

using account_t = account<1>;

}  // namespace tally::schema
