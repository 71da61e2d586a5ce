#pragma once
#include <tally/schema/primitives.hpp>
#include <optional>
#include <string>

namespace tally::schema {

template <uint16_t Version>
struct matching_rule;

// Data-driven coding rule for bank feed items. Higher priority is evaluated
// first and the first enabled match wins.
template <>
struct matching_rule<1> final {
  uint16_t version{1};
  company_id_t company_id{};
  hash32_t rule_id{};
  std::string name;
  int32_t priority{};
  // "CONTAINS 'text'" or bare text, matched case-insensitively against the
  // item description. Empty matches every description.
  std::string match_expression;
  std::optional<std::string> counter_party_pattern;
  std::optional<amount_t> min_amount;
  std::optional<amount_t> max_amount;
  account_id_t target_account_id{};
  std::optional<std::string> target_tax_code;
  // Supports {description} and {counter_party} placeholders.
  std::optional<std::string> memo_template;
  bool enabled{true};
};

using matching_rule_t = matching_rule<1>;

}  // namespace tally::schema
