#pragma once
#include <tally/schema/audit_action.hpp>
#include <tally/schema/primitives.hpp>
#include <string>

namespace tally::schema {

template <uint16_t Version>
struct audit_event;

template <>
struct audit_event<1> final {
  uint16_t version{1};
  company_id_t company_id{};
  // Assigned by the sink that persists the event.
  uint64_t sequence{};
  audit_action_t action{audit_action_t::transaction_posted};
  actor_id_t actor{};
  hash32_t subject_id{};
  std::string message;
  timestamp_milliseconds_t recorded_at{};
};

using audit_event_t = audit_event<1>;

}  // namespace tally::schema
