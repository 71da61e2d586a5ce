#include <tally/schema/primitives.hpp>

#include <algorithm>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace tally::schema {

namespace {

std::optional<uint8_t> hex_digit(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  auto lower = static_cast<char>(c | 0x20);
  if (lower >= 'a' && lower <= 'f') {
    return static_cast<uint8_t>(lower - 'a' + 10);
  }
  return std::nullopt;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{bytes.begin(), bytes.end()};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{bytes.begin(), bytes.end()};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

std::optional<hash32_t> try_make_hash32(std::string_view hex) {
  if (hex.starts_with("0x") || hex.starts_with("0X")) {
    hex.remove_prefix(2);
  }
  auto hash = hash32_t{};
  if (hex.size() != hash.size() * 2) {
    return std::nullopt;
  }
  for (std::size_t i = 0; i < hash.size(); ++i) {
    auto high = hex_digit(hex[2 * i]);
    auto low = hex_digit(hex[(2 * i) + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    hash[i] = static_cast<uint8_t>((*high << 4u) | *low);
  }
  return hash;
}

std::string to_hex(const bytes_view_t& bytes) {
  return fmt::format("{:02x}", fmt::join(bytes, ""));
}

std::string format_amount(const amount_t amount) {
  auto magnitude = amount < 0 ? -static_cast<uint64_t>(amount)
                              : static_cast<uint64_t>(amount);
  return fmt::format("{}{}.{:02}", amount < 0 ? "-" : "", magnitude / 100,
                     magnitude % 100);
}

}  // namespace tally::schema
