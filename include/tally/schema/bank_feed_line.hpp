#pragma once
#include <tally/schema/primitives.hpp>
#include <optional>
#include <string>

namespace tally::schema {

template <uint16_t Version>
struct bank_feed_line;

// Pre-parsed statement line as delivered by a feed importer.
template <>
struct bank_feed_line<1> final {
  uint16_t version{1};
  std::string fit_id;
  date_t posted_date{};
  amount_t amount{};
  std::string description;
  std::optional<std::string> counter_party;
};

using bank_feed_line_t = bank_feed_line<1>;

}  // namespace tally::schema
