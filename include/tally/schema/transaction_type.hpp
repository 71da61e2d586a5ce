#pragma once

#include <tally/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace tally::schema {

enum class transaction_type_t : uint8_t {
  payment = 0,
  receipt = 1,
  journal = 2,
  transfer = 3
};

inline constexpr auto kTransactionTypeMappings = std::array{
    std::pair<std::string_view, transaction_type_t>{"payment", transaction_type_t::payment},
    std::pair<std::string_view, transaction_type_t>{"receipt", transaction_type_t::receipt},
    std::pair<std::string_view, transaction_type_t>{"journal", transaction_type_t::journal},
    std::pair<std::string_view, transaction_type_t>{"transfer", transaction_type_t::transfer}};

template <>
inline std::optional<transaction_type_t> try_from_string<transaction_type_t>(
    const std::string_view value) {
  return from_string(value, kTransactionTypeMappings);
}

inline constexpr std::string_view to_string(const transaction_type_t value) {
  return to_string(value, kTransactionTypeMappings).value_or("unknown");
}

}  // namespace tally::schema
