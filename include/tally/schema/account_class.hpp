#pragma once

#include <tally/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Chart-of-accounts classification. The normal balance side of an account
// is a function of its classification alone.
namespace tally::schema {

enum class account_class_t : uint8_t {
  asset = 0,
  liability = 1,
  equity = 2,
  income = 3,
  expense = 4
};

inline constexpr auto kAccountClassMappings = std::array{
    std::pair<std::string_view, account_class_t>{"asset", account_class_t::asset},
    std::pair<std::string_view, account_class_t>{"liability", account_class_t::liability},
    std::pair<std::string_view, account_class_t>{"equity", account_class_t::equity},
    std::pair<std::string_view, account_class_t>{"income", account_class_t::income},
    std::pair<std::string_view, account_class_t>{"expense", account_class_t::expense}};

template <>
inline std::optional<account_class_t> try_from_string<account_class_t>(
    const std::string_view value) {
  return from_string(value, kAccountClassMappings);
}

inline constexpr std::string_view to_string(const account_class_t value) {
  return to_string(value, kAccountClassMappings).value_or("unknown");
}

enum class normal_balance_t : uint8_t { debit_positive = 0, credit_positive = 1 };

inline constexpr normal_balance_t normal_balance(const account_class_t value) {
  switch (value) {
    case account_class_t::asset:
    case account_class_t::expense:
      return normal_balance_t::debit_positive;
    case account_class_t::liability:
    case account_class_t::equity:
    case account_class_t::income:
      return normal_balance_t::credit_positive;
  }
  return normal_balance_t::debit_positive;
}

/// Display-correct balance for `debit - credit` movement on an account.
inline constexpr int64_t signed_balance(const account_class_t value,
                                        const int64_t debit,
                                        const int64_t credit) {
  return normal_balance(value) == normal_balance_t::debit_positive
             ? debit - credit
             : credit - debit;
}

}  // namespace tally::schema
