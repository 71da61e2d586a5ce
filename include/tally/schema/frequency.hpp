#pragma once

#include <tally/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Recurrence interval of a recurring transaction template.
namespace tally::schema {

enum class frequency_t : uint8_t {
  weekly = 0,
  fortnightly = 1,
  monthly = 2,
  quarterly = 3,
  yearly = 4
};

inline constexpr auto kFrequencyMappings = std::array{
    std::pair<std::string_view, frequency_t>{"weekly", frequency_t::weekly},
    std::pair<std::string_view, frequency_t>{"fortnightly", frequency_t::fortnightly},
    std::pair<std::string_view, frequency_t>{"monthly", frequency_t::monthly},
    std::pair<std::string_view, frequency_t>{"quarterly", frequency_t::quarterly},
    std::pair<std::string_view, frequency_t>{"yearly", frequency_t::yearly}};

template <>
inline std::optional<frequency_t> try_from_string<frequency_t>(
    const std::string_view value) {
  return from_string(value, kFrequencyMappings);
}

inline constexpr std::string_view to_string(const frequency_t value) {
  return to_string(value, kFrequencyMappings).value_or("unknown");
}

}  // namespace tally::schema
