#pragma once

#include <tally/schema/audit_action.hpp>
#include <tally/schema/audit_event.hpp>
#include <tally/schema/primitives.hpp>
#include <string>
#include <utility>

namespace tally::execution {

/// Envelope fields every command handler needs.
struct command_context final {
  tally::schema::company_id_t company_id{};
  tally::schema::actor_id_t actor{};
  tally::schema::timestamp_milliseconds_t issued_at{};

  tally::schema::audit_event_t make_event(
      const tally::schema::audit_action_t action,
      const tally::schema::hash32_t& subject_id,
      std::string message) const {
    return tally::schema::audit_event_t{.company_id = company_id,
                                        .action = action,
                                        .actor = actor,
                                        .subject_id = subject_id,
                                        .message = std::move(message),
                                        .recorded_at = issued_at};
  }
};

}  // namespace tally::execution
