#pragma once
#include <tally/common/critical.hpp>
#include <tally/schema/encoding/encoder.hpp>
#include <tally/schema/encoding/scale/account_class.hpp>
#include <tally/schema/encoding/scale/audit_action.hpp>
#include <tally/schema/encoding/scale/direction.hpp>
#include <tally/schema/encoding/scale/document_kind.hpp>
#include <tally/schema/encoding/scale/feed_item_status.hpp>
#include <tally/schema/encoding/scale/frequency.hpp>
#include <tally/schema/encoding/scale/posting_status.hpp>
#include <tally/schema/encoding/scale/statement_source.hpp>
#include <tally/schema/encoding/scale/transaction_type.hpp>
#include <scale/scale.hpp>

namespace tally::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  tally::schema::bytes_t encode(const T& obj);

  template <typename T>
  T decode(const tally::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const tally::schema::bytes_view_t& bytes);
};

using scale_encoder_t = encoder<scale_encoder_tag>;

template <typename T>
tally::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    tally::common::critical("failed to encode SCALE record: {}",
                            encoded.error().message());
  }
  return encoded.value();
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const tally::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    // Stored records are written by this process; a decode failure means
    // the database is corrupt or from an incompatible build.
    tally::common::critical("failed to decode SCALE record ({} bytes): {}",
                            bytes.size(), decoded.error().message());
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const tally::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace tally::schema::encoding
