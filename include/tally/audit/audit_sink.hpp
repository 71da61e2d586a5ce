#pragma once

#include <tally/schema/audit_event.hpp>

namespace tally::audit {

/// Destination for the audit events of committed commands.
///
/// The engine calls `record` after the command's unit of work committed.
/// An implementation may throw; the engine logs the failure and the command
/// still stands.
class audit_sink {
 public:
  virtual ~audit_sink() = default;

  virtual void record(const tally::schema::audit_event_t& event) = 0;
};

}  // namespace tally::audit
