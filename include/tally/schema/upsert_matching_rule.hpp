#pragma once
#include <tally/schema/primitives.hpp>
#include <optional>
#include <string>

namespace tally::schema {

template <uint16_t Version>
struct upsert_matching_rule;

template <>
struct upsert_matching_rule<1> final {
  uint16_t version{1};
  hash32_t rule_id{};
  std::string name;
  int32_t priority{};
  std::string match_expression;
  std::optional<std::string> counter_party_pattern;
  std::optional<amount_t> min_amount;
  std::optional<amount_t> max_amount;
  account_id_t target_account_id{};
  std::optional<std::string> target_tax_code;
  std::optional<std::string> memo_template;
  bool enabled{true};
};

using upsert_matching_rule_t = upsert_matching_rule<1>;

}  // namespace tally::schema
