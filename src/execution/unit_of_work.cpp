#include <spdlog/spdlog.h>
#include <algorithm>
#include <tally/execution/unit_of_work.hpp>

namespace tally::execution {

namespace {

bool has_prefix(const tally::schema::bytes_t& key,
                const tally::schema::bytes_view_t& prefix) {
  return key.size() >= prefix.size() &&
         std::equal(std::begin(prefix), std::end(prefix), std::begin(key));
}

}  // namespace

unit_of_work::unit_of_work(encoder_t& encoder, const storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

unit_of_work::unit_of_work(encoder_t& encoder,
                           const storage_t& storage,
                           read_only_tag)
    : encoder_{encoder}, storage_{storage}, snapshot_{storage.snapshot()} {}

std::optional<tally::schema::bytes_t> unit_of_work::read(
    const tally::schema::bytes_view_t& key) const {
  auto staged = staged_.find(tally::schema::make_bytes(key));
  if (staged != std::end(staged_)) {
    return staged->second;
  }
  return storage_.get_raw(key, snapshot_ ? &*snapshot_ : nullptr);
}

bool unit_of_work::contains(const tally::schema::bytes_view_t& key) const {
  return read(key).has_value();
}

void unit_of_work::erase(const tally::schema::bytes_view_t& key) {
  if (is_read_only()) {
    tally::common::critical("delete staged on a read-only unit of work");
  }
  staged_[tally::schema::make_bytes(key)] = std::nullopt;
}

std::vector<tally::storage::key_value_entry_t> unit_of_work::list_by_prefix(
    const tally::schema::bytes_view_t& prefix) const {
  auto committed =
      storage_.list_by_prefix(prefix, snapshot_ ? &*snapshot_ : nullptr);
  if (staged_.empty()) {
    return committed;
  }

  auto merged = std::map<tally::schema::bytes_t, tally::schema::bytes_t>{};
  for (auto& [key, value] : committed) {
    merged.emplace(std::move(key), std::move(value));
  }
  for (auto it = staged_.lower_bound(tally::schema::make_bytes(prefix));
       it != std::end(staged_) && has_prefix(it->first, prefix); ++it) {
    if (it->second) {
      merged[it->first] = *it->second;
    } else {
      merged.erase(it->first);
    }
  }

  auto entries = std::vector<tally::storage::key_value_entry_t>{};
  entries.reserve(merged.size());
  for (auto& [key, value] : merged) {
    entries.emplace_back(key, std::move(value));
  }
  return entries;
}

void unit_of_work::record(tally::schema::audit_event_t event) {
  events_.push_back(std::move(event));
}

const std::vector<tally::schema::audit_event_t>& unit_of_work::events() const {
  return events_;
}

std::size_t unit_of_work::staged_count() const {
  return staged_.size();
}

bool unit_of_work::is_read_only() const {
  return snapshot_.has_value();
}

void unit_of_work::commit() {
  if (is_read_only()) {
    tally::common::critical("commit called on a read-only unit of work");
  }
  if (committed_) {
    tally::common::critical("unit of work committed twice");
  }
  auto batch = tally::storage::write_batch{};
  for (auto& [key, value] : staged_) {
    if (value) {
      batch.puts.emplace_back(key, *value);
    } else {
      batch.deletes.push_back(key);
    }
  }
  storage_.apply(batch);
  spdlog::debug("Committed unit of work with {} put(s) and {} delete(s)",
                batch.puts.size(), batch.deletes.size());
  staged_.clear();
  committed_ = true;
}

encoder_t& unit_of_work::encoder() const {
  return encoder_;
}

}  // namespace tally::execution
