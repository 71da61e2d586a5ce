#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/snapshot.h>
#include <rocksdb/write_batch.h>
#include <tally/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string_view>

namespace tally::storage {

namespace detail {

inline tally::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const tally::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
class read_snapshot<rocksdb_storage_tag> final {
 public:
  explicit read_snapshot(ROCKSDB_NAMESPACE::DB* database)
      : database_{database}, snapshot_{database->GetSnapshot()} {}

  read_snapshot(const read_snapshot&) = delete;
  read_snapshot& operator=(const read_snapshot&) = delete;

  read_snapshot(read_snapshot&& other) noexcept
      : database_{other.database_}, snapshot_{other.snapshot_} {
    other.database_ = nullptr;
    other.snapshot_ = nullptr;
  }

  read_snapshot& operator=(read_snapshot&& other) noexcept {
    if (this != &other) {
      release();
      database_ = other.database_;
      snapshot_ = other.snapshot_;
      other.database_ = nullptr;
      other.snapshot_ = nullptr;
    }
    return *this;
  }

  ~read_snapshot() { release(); }

  const ROCKSDB_NAMESPACE::Snapshot* get() const { return snapshot_; }

 private:
  void release() {
    if (database_ != nullptr && snapshot_ != nullptr) {
      database_->ReleaseSnapshot(snapshot_);
    }
    database_ = nullptr;
    snapshot_ = nullptr;
  }

  ROCKSDB_NAMESPACE::DB* database_{nullptr};
  const ROCKSDB_NAMESPACE::Snapshot* snapshot_{nullptr};
};

using rocksdb_snapshot_t = read_snapshot<rocksdb_storage_tag>;

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const tally::schema::bytes_view_t& key,
                       const rocksdb_snapshot_t* snapshot = nullptr) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const tally::schema::bytes_view_t& key,
           const T& value) const;

  std::optional<tally::schema::bytes_t> get_raw(
      const tally::schema::bytes_view_t& key,
      const rocksdb_snapshot_t* snapshot = nullptr) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const tally::schema::bytes_view_t& prefix,
      const rocksdb_snapshot_t* snapshot = nullptr) const;
  void apply(const write_batch& batch) const;
  rocksdb_snapshot_t snapshot() const;

 private:
  ROCKSDB_NAMESPACE::ReadOptions read_options(
      const rocksdb_snapshot_t* snapshot) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const tally::schema::bytes_view_t& key,
    const rocksdb_snapshot_t* snapshot) const {
  auto value = get_raw(key, snapshot);
  if (!value) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(
      tally::schema::bytes_view_t{value->data(), value->size()})};
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const tally::schema::bytes_view_t& key,
                                       const T& value) const {
  auto batch = write_batch{};
  batch.puts.emplace_back(tally::schema::make_bytes(key), encoder.encode(value));
  apply(batch);
}

}  // namespace tally::storage
