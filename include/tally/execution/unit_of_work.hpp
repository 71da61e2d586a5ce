#pragma once

#include <tally/common/critical.hpp>
#include <tally/schema/audit_event.hpp>
#include <tally/schema/encoding/scale/encoder.hpp>
#include <tally/schema/primitives.hpp>
#include <tally/storage/rocksdb/storage.hpp>
#include <map>
#include <optional>
#include <vector>

namespace tally::execution {

using encoder_t = tally::schema::encoding::scale_encoder_t;
using storage_t = tally::storage::storage<tally::storage::rocksdb_storage_tag>;

/// Staged set of writes over committed storage.
///
/// Reads see committed state overlaid with this unit's own staged writes.
/// Nothing reaches storage until `commit()`, which applies every staged put
/// and delete in one RocksDB write batch. Dropping the unit discards it.
///
/// A read-only unit is pinned to a RocksDB snapshot so that multi-key reads
/// (reports, balance queries) observe a single committed state.
class unit_of_work final {
 public:
  struct read_only_tag {};
  static constexpr read_only_tag read_only{};

  unit_of_work(encoder_t& encoder, const storage_t& storage);
  unit_of_work(encoder_t& encoder,
               const storage_t& storage,
               read_only_tag tag);

  unit_of_work(const unit_of_work&) = delete;
  unit_of_work& operator=(const unit_of_work&) = delete;

  template <typename T>
  std::optional<T> get(const tally::schema::bytes_view_t& key) const;

  /// Decode every live value under prefix, in key order.
  template <typename T>
  std::vector<T> list(const tally::schema::bytes_view_t& prefix) const;

  template <typename T>
  void put(const tally::schema::bytes_view_t& key, const T& value);

  void erase(const tally::schema::bytes_view_t& key);

  bool contains(const tally::schema::bytes_view_t& key) const;

  std::vector<tally::storage::key_value_entry_t> list_by_prefix(
      const tally::schema::bytes_view_t& prefix) const;

  /// Queue an audit event, handed to the audit sink after commit.
  void record(tally::schema::audit_event_t event);
  const std::vector<tally::schema::audit_event_t>& events() const;

  std::size_t staged_count() const;
  bool is_read_only() const;

  /// Apply all staged writes atomically. A read-only unit cannot commit.
  void commit();

  encoder_t& encoder() const;

 private:
  std::optional<tally::schema::bytes_t> read(
      const tally::schema::bytes_view_t& key) const;

  encoder_t& encoder_;
  const storage_t& storage_;
  std::optional<tally::storage::rocksdb_snapshot_t> snapshot_;
  // std::nullopt marks a staged delete.
  std::map<tally::schema::bytes_t, std::optional<tally::schema::bytes_t>>
      staged_;
  std::vector<tally::schema::audit_event_t> events_;
  bool committed_{};
};

template <typename T>
std::optional<T> unit_of_work::get(
    const tally::schema::bytes_view_t& key) const {
  auto value = read(key);
  if (!value) {
    return std::nullopt;
  }
  return encoder_.decode<T>(
      tally::schema::bytes_view_t{value->data(), value->size()});
}

template <typename T>
std::vector<T> unit_of_work::list(
    const tally::schema::bytes_view_t& prefix) const {
  auto values = std::vector<T>{};
  for (const auto& [key, value] : list_by_prefix(prefix)) {
    values.push_back(encoder_.decode<T>(
        tally::schema::bytes_view_t{value.data(), value.size()}));
  }
  return values;
}

template <typename T>
void unit_of_work::put(const tally::schema::bytes_view_t& key,
                       const T& value) {
  if (is_read_only()) {
    tally::common::critical("write staged on a read-only unit of work");
  }
  staged_[tally::schema::make_bytes(key)] = encoder_.encode(value);
}

}  // namespace tally::execution
