#include <tally/blake3/hash.hpp>
#include <tally/schema/key/builder.hpp>
#include <tally/schema/key/keys.hpp>

using namespace tally::schema::key;

builder& builder::write(const std::string_view& str) {
  data.insert(std::end(data), std::begin(str), std::end(str));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  data.insert(std::end(data), std::begin(bytes), std::end(bytes));
  return *this;
}

builder& builder::write_date(const date_t date) {
  return write(ordered_date(date));
}

builder& builder::hash(const std::string_view& str) {
  return write(tally::blake3::hash(str));
}
