#pragma once

#include <tally/execution/engine.hpp>
#include <tally/schema/primitives.hpp>
#include <cstddef>

namespace tally::scheduler {

struct recurring_run_summary final {
  std::size_t executed{};
  std::size_t failed{};
};

/// Periodic jobs. Every run goes through `engine::execute`, so scheduled
/// postings are validated and committed like any other command.
class scheduler final {
 public:
  explicit scheduler(tally::execution::engine& engine);

  /// Run every enabled template whose next run date is on or before
  /// `as_of`, catching up missed periods one run at a time. A failed run
  /// stops that template until the next call.
  recurring_run_summary run_recurring(
      const tally::schema::company_id_t& company_id,
      const tally::schema::actor_id_t& actor,
      tally::schema::date_t as_of,
      tally::schema::timestamp_milliseconds_t now);

  /// Purge audit events outside the company's retention window.
  std::size_t enforce_retention(const tally::schema::company_id_t& company_id,
                                tally::schema::timestamp_milliseconds_t now);

 private:
  tally::execution::engine& engine_;
};

}  // namespace tally::scheduler
