#pragma once
#include <tally/schema/primitives.hpp>
#include <optional>
#include <utility>
#include <vector>

namespace tally::storage {

using key_value_entry_t =
    std::pair<tally::schema::bytes_t, tally::schema::bytes_t>;

/// Writes applied atomically by `storage::apply`.
struct write_batch final {
  std::vector<key_value_entry_t> puts;
  std::vector<tally::schema::bytes_t> deletes;
};

/// Point-in-time read view. Released when destroyed.
template <typename Library>
class read_snapshot;

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const tally::schema::bytes_view_t& key,
                       const read_snapshot<Library>* snapshot = nullptr) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const tally::schema::bytes_view_t& key,
           const T& value) const;

  /// Raw value at key, or std::nullopt when missing.
  std::optional<tally::schema::bytes_t> get_raw(
      const tally::schema::bytes_view_t& key,
      const read_snapshot<Library>* snapshot = nullptr) const;

  /// Return all key-value pairs that share the provided key prefix, in key
  /// order.
  std::vector<key_value_entry_t> list_by_prefix(
      const tally::schema::bytes_view_t& prefix,
      const read_snapshot<Library>* snapshot = nullptr) const;

  /// Apply every put and delete of the batch, or none of them.
  void apply(const write_batch& batch) const;

  /// Pin the current committed state for consistent multi-key reads.
  read_snapshot<Library> snapshot() const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace tally::storage
