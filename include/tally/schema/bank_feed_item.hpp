#pragma once
#include <tally/schema/feed_item_status.hpp>
#include <tally/schema/primitives.hpp>
#include <optional>
#include <string>

namespace tally::schema {

template <uint16_t Version>
struct bank_feed_item;

template <>
struct bank_feed_item<1> final {
  uint16_t version{1};
  company_id_t company_id{};
  hash32_t import_id{};
  account_id_t bank_account_id{};
  // External identifier, unique within an import batch.
  std::string fit_id;
  date_t posted_date{};
  // Positive is money into the bank account.
  amount_t amount{};
  std::string description;
  std::optional<std::string> counter_party;
  feed_item_status_t status{feed_item_status_t::unmatched};
  std::optional<transaction_id_t> matched_transaction_id;
  std::optional<hash32_t> matched_rule_id;
  std::optional<timestamp_milliseconds_t> status_changed_at;
  // Transactions rules have coded from this item, voided ones included.
  uint32_t rule_codings{};
};

using bank_feed_item_t = bank_feed_item<1>;

}  // namespace tally::schema
