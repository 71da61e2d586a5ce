#pragma once

#include <tally/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace tally::schema {

enum class statement_source_t : uint8_t {
  qif = 0,
  ofx = 1,
  qfx = 2,
  qbo = 3,
  csv = 4
};

inline constexpr auto kStatementSourceMappings = std::array{
    std::pair<std::string_view, statement_source_t>{"qif", statement_source_t::qif},
    std::pair<std::string_view, statement_source_t>{"ofx", statement_source_t::ofx},
    std::pair<std::string_view, statement_source_t>{"qfx", statement_source_t::qfx},
    std::pair<std::string_view, statement_source_t>{"qbo", statement_source_t::qbo},
    std::pair<std::string_view, statement_source_t>{"csv", statement_source_t::csv}};

template <>
inline std::optional<statement_source_t> try_from_string<statement_source_t>(
    const std::string_view value) {
  return from_string(value, kStatementSourceMappings);
}

inline constexpr std::string_view to_string(const statement_source_t value) {
  return to_string(value, kStatementSourceMappings).value_or("unknown");
}

}  // namespace tally::schema
