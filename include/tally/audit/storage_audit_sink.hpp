#pragma once

#include <tally/audit/audit_sink.hpp>
#include <tally/execution/unit_of_work.hpp>
#include <tally/schema/audit_event.hpp>
#include <tally/schema/primitives.hpp>
#include <cstddef>
#include <mutex>
#include <vector>

namespace tally::audit {

/// Persists events under the AUDIT keyspace, ordered by recording time and
/// a per-company sequence.
class storage_audit_sink final : public audit_sink {
 public:
  storage_audit_sink(tally::execution::encoder_t& encoder,
                     const tally::execution::storage_t& storage);

  void record(const tally::schema::audit_event_t& event) override;

 private:
  std::mutex mutex_;
  tally::execution::encoder_t& encoder_;
  const tally::execution::storage_t& storage_;
};

/// Stored events of a company, oldest first.
std::vector<tally::schema::audit_event_t> load_events(
    tally::execution::encoder_t& encoder,
    const tally::execution::storage_t& storage,
    const tally::schema::company_id_t& company_id);

/// Delete events recorded more than `retention_days` before `now`. Writes
/// only the audit keyspace, in its own batch. Returns the number deleted.
std::size_t purge_expired_events(
    tally::execution::encoder_t& encoder,
    const tally::execution::storage_t& storage,
    const tally::schema::company_id_t& company_id,
    uint32_t retention_days,
    tally::schema::timestamp_milliseconds_t now);

}  // namespace tally::audit
