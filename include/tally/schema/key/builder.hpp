#pragma once
#include <tally/schema/primitives.hpp>
#include <boost/endian/conversion.hpp>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace tally::schema::key {

// Byte-string key composer. Integers are written big-endian so that RocksDB's
// bytewise ordering follows numeric ordering for unsigned values.
struct builder final {
  tally::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);

  /// Dates are signed; this writes them so that byte order is date order.
  builder& write_date(date_t date);

  /// Append the BLAKE3 digest of variable-length input, keeping the key
  /// fixed-width after this point.
  builder& hash(const std::string_view& str);

  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write(T value) {
    auto big = boost::endian::native_to_big(value);
    auto bytes = reinterpret_cast<const uint8_t*>(&big);
    data.insert(std::end(data), bytes, bytes + sizeof(T));
    return *this;
  }
};

}  // namespace tally::schema::key
