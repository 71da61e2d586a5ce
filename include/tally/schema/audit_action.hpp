#pragma once

#include <tally/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Financial operations reported to the audit sink after commit.
namespace tally::schema {

enum class audit_action_t : uint8_t {
  transaction_posted = 0,
  transaction_voided = 1,
  document_posted = 2,
  document_voided = 3,
  allocation_created = 4,
  allocation_removed = 5,
  statement_imported = 6,
  feed_item_matched = 7,
  feed_item_ignored = 8,
  recurring_executed = 9
};

inline constexpr auto kAuditActionMappings = std::array{
    std::pair<std::string_view, audit_action_t>{"transaction_posted", audit_action_t::transaction_posted},
    std::pair<std::string_view, audit_action_t>{"transaction_voided", audit_action_t::transaction_voided},
    std::pair<std::string_view, audit_action_t>{"document_posted", audit_action_t::document_posted},
    std::pair<std::string_view, audit_action_t>{"document_voided", audit_action_t::document_voided},
    std::pair<std::string_view, audit_action_t>{"allocation_created", audit_action_t::allocation_created},
    std::pair<std::string_view, audit_action_t>{"allocation_removed", audit_action_t::allocation_removed},
    std::pair<std::string_view, audit_action_t>{"statement_imported", audit_action_t::statement_imported},
    std::pair<std::string_view, audit_action_t>{"feed_item_matched", audit_action_t::feed_item_matched},
    std::pair<std::string_view, audit_action_t>{"feed_item_ignored", audit_action_t::feed_item_ignored},
    std::pair<std::string_view, audit_action_t>{"recurring_executed", audit_action_t::recurring_executed}};

template <>
inline std::optional<audit_action_t> try_from_string<audit_action_t>(
    const std::string_view value) {
  return from_string(value, kAuditActionMappings);
}

inline constexpr std::string_view to_string(const audit_action_t value) {
  return to_string(value, kAuditActionMappings).value_or("unknown");
}

}  // namespace tally::schema
