#include <spdlog/spdlog.h>
#include <tally/scheduler/scheduler.hpp>
#include <tally/schema/date.hpp>
#include <tally/schema/run_recurring_template.hpp>
#include <algorithm>

using namespace tally::schema;

namespace tally::scheduler {

scheduler::scheduler(tally::execution::engine& engine) : engine_{engine} {}

recurring_run_summary scheduler::run_recurring(const company_id_t& company_id,
                                               const actor_id_t& actor,
                                               const date_t as_of,
                                               const timestamp_milliseconds_t now) {
  auto summary = recurring_run_summary{};
  for (const auto& recurring : engine_.recurring_templates(company_id)) {
    auto template_id = recurring.template_id;
    auto next_run = recurring.next_run_date;
    auto enabled = recurring.enabled;
    while (enabled && next_run <= as_of) {
      auto command = command_t{};
      command.company_id = company_id;
      command.actor = actor;
      command.issued_at = now;
      command.payload = run_recurring_template_t{.template_id = template_id,
                                                 .run_date = next_run};
      auto result = engine_.execute(command);
      if (result.code != 0) {
        spdlog::warn("Recurring template {} failed for {}: {}",
                     recurring.name, to_iso_string(next_run), result.log);
        ++summary.failed;
        break;
      }
      ++summary.executed;

      auto reloaded = engine_.recurring_templates(company_id);
      auto found = std::find_if(
          std::begin(reloaded), std::end(reloaded),
          [&](const recurring_template_t& candidate) {
            return candidate.template_id == template_id;
          });
      if (found == std::end(reloaded)) {
        break;
      }
      next_run = found->next_run_date;
      enabled = found->enabled;
    }
  }
  if (summary.executed > 0 || summary.failed > 0) {
    spdlog::info("Recurring run as of {}: {} executed, {} failed",
                 to_iso_string(as_of), summary.executed, summary.failed);
  }
  return summary;
}

std::size_t scheduler::enforce_retention(const company_id_t& company_id,
                                         const timestamp_milliseconds_t now) {
  return engine_.enforce_retention(company_id, now);
}

}  // namespace tally::scheduler
