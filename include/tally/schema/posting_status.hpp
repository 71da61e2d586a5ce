#pragma once

#include <tally/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Lifecycle shared by transactions and allocatable documents:
// draft -> posted -> void. Only drafts are mutable.
namespace tally::schema {

enum class posting_status_t : uint8_t {
  draft = 0,
  posted = 1,
  voided = 2
};

inline constexpr auto kPostingStatusMappings = std::array{
    std::pair<std::string_view, posting_status_t>{"draft", posting_status_t::draft},
    std::pair<std::string_view, posting_status_t>{"posted", posting_status_t::posted},
    std::pair<std::string_view, posting_status_t>{"void", posting_status_t::voided}};

template <>
inline std::optional<posting_status_t> try_from_string<posting_status_t>(
    const std::string_view value) {
  return from_string(value, kPostingStatusMappings);
}

inline constexpr std::string_view to_string(const posting_status_t value) {
  return to_string(value, kPostingStatusMappings).value_or("unknown");
}

}  // namespace tally::schema
