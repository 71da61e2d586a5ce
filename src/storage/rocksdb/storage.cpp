#include <tally/common/critical.hpp>
#include <tally/storage/rocksdb/storage.hpp>

namespace tally::storage {

namespace {

void require_open(const std::unique_ptr<ROCKSDB_NAMESPACE::DB>& database) {
  if (!database) {
    tally::common::critical("ledger database is not open");
  }
}

}  // namespace

ROCKSDB_NAMESPACE::ReadOptions storage<rocksdb_storage_tag>::read_options(
    const rocksdb_snapshot_t* snapshot) const {
  auto options = ROCKSDB_NAMESPACE::ReadOptions{};
  if (snapshot != nullptr) {
    options.snapshot = snapshot->get();
  }
  return options;
}

std::optional<tally::schema::bytes_t> storage<rocksdb_storage_tag>::get_raw(
    const tally::schema::bytes_view_t& key,
    const rocksdb_snapshot_t* snapshot) const {
  require_open(database);
  auto value = std::string{};
  auto status =
      database->Get(read_options(snapshot), detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    tally::common::critical("RocksDB get failed: {}", status.ToString());
  }
  return tally::schema::bytes_t(std::begin(value), std::end(value));
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const tally::schema::bytes_view_t& prefix,
    const rocksdb_snapshot_t* snapshot) const {
  require_open(database);

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_view = std::string_view{
      reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options(snapshot))};
  iterator->Seek(detail::to_slice(prefix));
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_view)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    tally::common::critical("RocksDB prefix scan failed: {}",
                            iterator->status().ToString());
  }
  return entries;
}

void storage<rocksdb_storage_tag>::apply(const write_batch& batch) const {
  require_open(database);

  auto rocks_batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& key : batch.deletes) {
    auto delete_status = rocks_batch.Delete(detail::to_slice(key));
    if (!delete_status.ok()) {
      tally::common::critical("RocksDB batch delete failed: {}",
                              delete_status.ToString());
    }
  }
  for (const auto& [key, value] : batch.puts) {
    auto put_status =
        rocks_batch.Put(detail::to_slice(key), detail::to_slice(value));
    if (!put_status.ok()) {
      tally::common::critical("RocksDB batch put failed: {}",
                              put_status.ToString());
    }
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &rocks_batch);
  if (!write_status.ok()) {
    tally::common::critical("RocksDB write of {} puts and {} deletes failed: {}",
                            batch.puts.size(), batch.deletes.size(),
                            write_status.ToString());
  }
}

rocksdb_snapshot_t storage<rocksdb_storage_tag>::snapshot() const {
  require_open(database);
  return rocksdb_snapshot_t{database.get()};
}

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    tally::common::critical("Failed to open ledger database at {}: {}", path,
                            status.ToString());
  }
  spdlog::info("Opened ledger database at {}", path);
  store.database.reset(database);

  return store;
}

}  // namespace tally::storage
