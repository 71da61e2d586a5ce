#pragma once
#include <tally/schema/primitives.hpp>
#include <optional>
#include <string>

namespace tally::schema {

template <uint16_t Version>
struct match_feed_item;

template <>
struct match_feed_item<1> final {
  uint16_t version{1};
  hash32_t import_id{};
  std::string fit_id;
  // Explicit link; when absent the matcher picks a transaction or rule.
  std::optional<transaction_id_t> transaction_id;
};

using match_feed_item_t = match_feed_item<1>;

}  // namespace tally::schema
