#pragma once

#include <tally/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace tally::schema {

enum class feed_item_status_t : uint8_t {
  unmatched = 0,
  matched = 1,
  ignored = 2
};

inline constexpr auto kFeedItemStatusMappings = std::array{
    std::pair<std::string_view, feed_item_status_t>{"new", feed_item_status_t::unmatched},
    std::pair<std::string_view, feed_item_status_t>{"matched", feed_item_status_t::matched},
    std::pair<std::string_view, feed_item_status_t>{"ignored", feed_item_status_t::ignored}};

template <>
inline std::optional<feed_item_status_t> try_from_string<feed_item_status_t>(
    const std::string_view value) {
  return from_string(value, kFeedItemStatusMappings);
}

inline constexpr std::string_view to_string(const feed_item_status_t value) {
  return to_string(value, kFeedItemStatusMappings).value_or("unknown");
}

}  // namespace tally::schema
