#pragma once
#include <tally/schema/primitives.hpp>
#include <optional>
#include <span>

namespace tally::schema::encoding {

// Codec seam for persisted records. The library is picked at build time
// through the tag type; records are plain aggregates so any codec that can
// walk aggregates fits.
template <typename Library>
struct encoder {
  template <typename T>
  tally::schema::bytes_t encode(const T& obj);

  template <typename T>
  T decode(const tally::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const tally::schema::bytes_view_t& bytes);
};

}  // namespace tally::schema::encoding
