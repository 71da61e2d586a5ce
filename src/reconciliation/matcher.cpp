#include <tally/reconciliation/matcher.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/replace.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <algorithm>
#include <cstdlib>
#include <optional>

using namespace tally::schema;

namespace tally::reconciliation {

namespace {

constexpr std::string_view kContainsKeyword{"CONTAINS"};

}  // namespace

std::string contains_operand(const std::string_view expression) {
  auto operand = boost::algorithm::trim_copy(std::string{expression});
  if (boost::algorithm::istarts_with(operand, kContainsKeyword)) {
    operand = boost::algorithm::trim_copy(
        operand.substr(kContainsKeyword.size()));
  }
  if (operand.size() >= 2 &&
      (operand.front() == '\'' || operand.front() == '"') &&
      operand.back() == operand.front()) {
    operand = operand.substr(1, operand.size() - 2);
  }
  return operand;
}

bool rule_matches(const matching_rule_t& rule, const bank_feed_item_t& item) {
  if (!rule.enabled) {
    return false;
  }
  auto operand = contains_operand(rule.match_expression);
  if (!operand.empty() &&
      !boost::algorithm::icontains(item.description, operand)) {
    return false;
  }
  if (rule.counter_party_pattern && !rule.counter_party_pattern->empty()) {
    if (!item.counter_party ||
        !boost::algorithm::icontains(*item.counter_party,
                                     *rule.counter_party_pattern)) {
      return false;
    }
  }
  // Amount bounds apply to the magnitude so one rule covers both directions.
  auto magnitude = std::abs(item.amount);
  if (rule.min_amount && magnitude < *rule.min_amount) {
    return false;
  }
  if (rule.max_amount && magnitude > *rule.max_amount) {
    return false;
  }
  return true;
}

std::string render_memo(const matching_rule_t& rule,
                        const bank_feed_item_t& item) {
  if (!rule.memo_template || rule.memo_template->empty()) {
    return item.description;
  }
  auto memo = *rule.memo_template;
  boost::algorithm::replace_all(memo, "{description}", item.description);
  boost::algorithm::replace_all(memo, "{counter_party}",
                                item.counter_party.value_or(""));
  return memo;
}

match_decision_t match(const bank_feed_item_t& item,
                       const std::vector<match_candidate>& candidates,
                       std::vector<matching_rule_t> rules,
                       const match_options& options) {
  auto best = std::optional<match_candidate>{};
  auto best_distance = int64_t{};
  for (const auto& candidate : candidates) {
    if (candidate.amount != item.amount) {
      continue;
    }
    auto distance = std::abs(static_cast<int64_t>(candidate.date) -
                             static_cast<int64_t>(item.posted_date));
    if (distance > static_cast<int64_t>(options.window_days)) {
      continue;
    }
    if (!best || distance < best_distance ||
        (distance == best_distance &&
         candidate.first_sequence < best->first_sequence)) {
      best = candidate;
      best_distance = distance;
    }
  }
  if (best) {
    return existing_transaction_match{.transaction_id = best->transaction_id};
  }

  std::stable_sort(std::begin(rules), std::end(rules),
                   [](const matching_rule_t& lhs, const matching_rule_t& rhs) {
                     return lhs.priority > rhs.priority;
                   });
  for (auto& rule : rules) {
    if (rule_matches(rule, item)) {
      auto memo = render_memo(rule, item);
      return rule_match{.rule = std::move(rule), .memo = std::move(memo)};
    }
  }
  return std::monostate{};
}

}  // namespace tally::reconciliation
