#pragma once

#include <tally/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace tally::schema {

enum class direction_t : uint8_t {
  debit = 0,
  credit = 1
};

inline constexpr auto kDirectionMappings = std::array{
    std::pair<std::string_view, direction_t>{"debit", direction_t::debit},
    std::pair<std::string_view, direction_t>{"credit", direction_t::credit}};

template <>
inline std::optional<direction_t> try_from_string<direction_t>(
    const std::string_view value) {
  return from_string(value, kDirectionMappings);
}

inline constexpr std::string_view to_string(const direction_t value) {
  return to_string(value, kDirectionMappings).value_or("unknown");
}

inline constexpr direction_t flip(const direction_t value) {
  return value == direction_t::debit ? direction_t::credit : direction_t::debit;
}

}  // namespace tally::schema
