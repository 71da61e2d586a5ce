#pragma once

#include <tally/schema/bank_feed_item.hpp>
#include <tally/schema/matching_rule.hpp>
#include <tally/schema/primitives.hpp>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// Pure matching of one bank feed item against candidate transactions and
// coding rules. Nothing here reads or writes storage.
namespace tally::reconciliation {

/// Posted transaction touching the bank account, reduced to what matching
/// needs. `amount` is the signed movement on the bank account (debit
/// positive), comparable with a feed item amount.
struct match_candidate final {
  tally::schema::transaction_id_t transaction_id{};
  tally::schema::date_t date{};
  tally::schema::amount_t amount{};
  uint64_t first_sequence{};
};

struct match_options final {
  uint32_t window_days{3};
};

struct existing_transaction_match final {
  tally::schema::transaction_id_t transaction_id{};
};

struct rule_match final {
  tally::schema::matching_rule_t rule;
  std::string memo;
};

/// std::monostate when neither a transaction nor a rule matched.
using match_decision_t =
    std::variant<std::monostate, existing_transaction_match, rule_match>;

/// Text operand of a rule expression: `CONTAINS 'text'` yields `text`, any
/// other expression is taken as the text itself.
std::string contains_operand(std::string_view expression);

bool rule_matches(const tally::schema::matching_rule_t& rule,
                  const tally::schema::bank_feed_item_t& item);

/// Expand {description} and {counter_party} in the rule's memo template.
/// Without a template the memo is the item description.
std::string render_memo(const tally::schema::matching_rule_t& rule,
                        const tally::schema::bank_feed_item_t& item);

/// Pick the transaction or rule for an item.
///
/// A candidate with exactly the item amount dated within the window wins,
/// preferring the nearest date and then the earliest posting. Otherwise the
/// enabled rules are tried in descending priority (ties keep their given
/// order) and the first that matches wins.
match_decision_t match(const tally::schema::bank_feed_item_t& item,
                       const std::vector<match_candidate>& candidates,
                       std::vector<tally::schema::matching_rule_t> rules,
                       const match_options& options = {});

}  // namespace tally::reconciliation
