#include <spdlog/spdlog.h>
#include <tally/audit/storage_audit_sink.hpp>
#include <tally/execution/result.hpp>
#include <tally/schema/key/keys.hpp>

using namespace tally::schema;

namespace tally::audit {

namespace {

constexpr auto kMillisecondsPerDay = timestamp_milliseconds_t{86'400'000};

bytes_view_t view(const bytes_t& bytes) {
  return bytes_view_t{bytes.data(), bytes.size()};
}

}  // namespace

storage_audit_sink::storage_audit_sink(
    tally::execution::encoder_t& encoder,
    const tally::execution::storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

void storage_audit_sink::record(const audit_event_t& event) {
  auto lock = std::scoped_lock{mutex_};
  auto sequence_key = key::make_audit_sequence_key(event.company_id);
  auto sequence =
      storage_.get<uint64_t>(encoder_, view(sequence_key)).value_or(1);

  auto stored = event;
  stored.sequence = sequence;
  auto batch = tally::storage::write_batch{};
  batch.puts.emplace_back(
      key::make_audit_event_key(stored.company_id, stored.recorded_at,
                                stored.sequence),
      encoder_.encode(stored));
  batch.puts.emplace_back(sequence_key, encoder_.encode(sequence + 1));
  storage_.apply(batch);
  spdlog::debug("Recorded audit event {} {} for {}", stored.sequence,
                to_string(stored.action),
                tally::execution::short_id(stored.subject_id));
}

std::vector<audit_event_t> load_events(
    tally::execution::encoder_t& encoder,
    const tally::execution::storage_t& storage,
    const company_id_t& company_id) {
  auto events = std::vector<audit_event_t>{};
  auto prefix = key::make_company_prefix(key::kAuditEventKeyPrefix, company_id);
  for (const auto& [key, value] : storage.list_by_prefix(view(prefix))) {
    events.push_back(encoder.decode<audit_event_t>(view(value)));
  }
  return events;
}

std::size_t purge_expired_events(tally::execution::encoder_t& encoder,
                                 const tally::execution::storage_t& storage,
                                 const company_id_t& company_id,
                                 const uint32_t retention_days,
                                 const timestamp_milliseconds_t now) {
  auto window = static_cast<timestamp_milliseconds_t>(retention_days) *
                kMillisecondsPerDay;
  if (now <= window) {
    return 0;
  }
  auto cutoff = now - window;

  auto batch = tally::storage::write_batch{};
  auto prefix = key::make_company_prefix(key::kAuditEventKeyPrefix, company_id);
  for (const auto& [key, value] : storage.list_by_prefix(view(prefix))) {
    auto event = encoder.decode<audit_event_t>(view(value));
    // Keys are ordered by recording time.
    if (event.recorded_at >= cutoff) {
      break;
    }
    batch.deletes.push_back(key);
  }
  if (batch.deletes.empty()) {
    return 0;
  }
  storage.apply(batch);
  spdlog::info("Purged {} audit events older than {} days", batch.deletes.size(),
               retention_days);
  return batch.deletes.size();
}

}  // namespace tally::audit
