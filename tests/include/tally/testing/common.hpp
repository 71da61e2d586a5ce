#pragma once

#include <tally/execution/unit_of_work.hpp>
#include <tally/schema/primitives.hpp>
#include <tally/storage/rocksdb/storage.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace tally::testing {

/// Deterministic id whose bytes count up from `seed`.
inline tally::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = tally::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + i);
  }
  return out;
}

/// RocksDB database in its own temporary directory. The database is closed
/// and the directory removed when the object goes away.
class temp_database final {
 public:
  explicit temp_database(const std::string_view prefix)
      : path_{unique_path(prefix)},
        storage_{tally::storage::make_storage<
            tally::storage::rocksdb_storage_tag>(path_.string())} {}

  temp_database(const temp_database&) = delete;
  temp_database& operator=(const temp_database&) = delete;
  temp_database(temp_database&&) = delete;
  temp_database& operator=(temp_database&&) = delete;

  ~temp_database() {
    storage_.database.reset();
    auto error = std::error_code{};
    std::filesystem::remove_all(path_, error);
  }

  const std::filesystem::path& path() const { return path_; }
  tally::execution::storage_t& storage() { return storage_; }

 private:
  static std::filesystem::path unique_path(const std::string_view prefix) {
    static auto counter = std::atomic<uint64_t>{};
    const auto ticks =
        std::chrono::steady_clock::now().time_since_epoch().count();
    return std::filesystem::temp_directory_path() /
           (std::string{prefix} + "_" + std::to_string(ticks) + "_" +
            std::to_string(++counter));
  }

  std::filesystem::path path_;
  tally::execution::storage_t storage_;
};

}  // namespace tally::testing
