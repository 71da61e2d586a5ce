#pragma once
#include <tally/schema/account_class.hpp>
#include <tally/schema/primitives.hpp>
#include <optional>
#include <string>

namespace tally::schema {

template <uint16_t Version>
struct upsert_account;

template <>
struct upsert_account<1> final {
  uint16_t version{1};
  account_id_t account_id{};
  std::string code;
  std::string name;
  account_class_t classification{account_class_t::asset};
  bool active{true};
  std::optional<account_id_t> parent_id;
  std::optional<uint32_t> security_level;
  bool is_bank{};
};

using upsert_account_t = upsert_account<1>;

}  // namespace tally::schema
