#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tally::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;

// Identifiers are chosen by the caller, or derived by hashing a parent id.
using company_id_t = hash32_t;
using account_id_t = hash32_t;
using transaction_id_t = hash32_t;
using document_id_t = hash32_t;
using actor_id_t = hash32_t;

// Minor currency units (cents). Line amounts are positive, balances signed.
using amount_t = int64_t;
// Days since 1970-01-01.
using date_t = int32_t;
using timestamp_milliseconds_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string_view& bytes);
bytes_view_t make_bytes_view(const bytes_t& bytes);

/// Parse 64 hex digits, with or without a 0x prefix.
std::optional<hash32_t> try_make_hash32(std::string_view hex);
std::string to_hex(const bytes_view_t& bytes);

/// Render minor units as a decimal string with two fraction digits.
std::string format_amount(const amount_t amount);

}  // namespace tally::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
