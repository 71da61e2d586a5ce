#pragma once

#include <tally/audit/audit_sink.hpp>
#include <tally/execution/unit_of_work.hpp>
#include <tally/schema/account.hpp>
#include <tally/schema/allocation.hpp>
#include <tally/schema/bank_feed_item.hpp>
#include <tally/schema/command.hpp>
#include <tally/schema/company_settings.hpp>
#include <tally/schema/document_state.hpp>
#include <tally/schema/ledger_entry.hpp>
#include <tally/schema/operation_result.hpp>
#include <tally/schema/primitives.hpp>
#include <tally/schema/recurring_template.hpp>
#include <tally/schema/transaction_state.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace tally::execution {

/// Runtime options of the engine.
struct engine_options final {
  // Days either side of a feed item's date searched for matching
  // transactions.
  uint32_t match_window_days{3};
};

/// Command processor for the ledger.
///
/// Each command runs in its own unit of work under the writer lock: the
/// handler validates, stages its writes and audit events, and the unit is
/// committed only when the handler succeeds. Audit events are handed to the
/// sink after the commit. Queries read from a snapshot and never take the
/// writer lock.
class engine final {
 public:
  engine(encoder_t& encoder,
         storage_t& storage,
         engine_options options = {});

  /// Run one command and return its result. A failed command commits
  /// nothing.
  tally::schema::operation_result_t execute(
      const tally::schema::command_t& command);

  /// Decode a SCALE encoded command and run it.
  tally::schema::operation_result_t execute(
      const tally::schema::bytes_view_t& raw_command);

  /// Replace the audit sink. The default persists events in storage.
  void set_audit_sink(std::shared_ptr<tally::audit::audit_sink> sink);

  /// Delete audit events older than the company's retention window. Runs
  /// without the writer lock and touches only the audit keyspace.
  std::size_t enforce_retention(
      const tally::schema::company_id_t& company_id,
      tally::schema::timestamp_milliseconds_t now);

  tally::schema::company_settings_t company_settings(
      const tally::schema::company_id_t& company_id) const;

  std::optional<tally::schema::account_t> find_account(
      const tally::schema::company_id_t& company_id,
      const tally::schema::account_id_t& account_id) const;
  std::optional<tally::schema::account_t> find_account_by_code(
      const tally::schema::company_id_t& company_id,
      std::string_view code) const;
  std::optional<tally::schema::transaction_state_t> find_transaction(
      const tally::schema::company_id_t& company_id,
      const tally::schema::transaction_id_t& transaction_id) const;
  std::optional<tally::schema::document_state_t> find_document(
      const tally::schema::company_id_t& company_id,
      const tally::schema::document_id_t& document_id) const;
  std::vector<tally::schema::allocation_t> allocations_for_document(
      const tally::schema::company_id_t& company_id,
      const tally::schema::document_id_t& document_id) const;
  std::optional<tally::schema::bank_feed_item_t> find_feed_item(
      const tally::schema::company_id_t& company_id,
      const tally::schema::hash32_t& import_id,
      std::string_view fit_id) const;
  /// Every item of one statement import, in key order.
  std::vector<tally::schema::bank_feed_item_t> feed_items_for_import(
      const tally::schema::company_id_t& company_id,
      const tally::schema::hash32_t& import_id) const;
  std::vector<tally::schema::recurring_template_t> recurring_templates(
      const tally::schema::company_id_t& company_id) const;

  /// Unallocated cash of a transaction, std::nullopt when it does not exist.
  std::optional<tally::schema::amount_t> unallocated_amount(
      const tally::schema::company_id_t& company_id,
      const tally::schema::transaction_id_t& transaction_id) const;

  std::optional<tally::schema::amount_t> balance_as_of(
      const tally::schema::company_id_t& company_id,
      const tally::schema::account_id_t& account_id,
      tally::schema::date_t as_of) const;

  std::vector<tally::schema::ledger_entry_t> entries_in_range(
      const tally::schema::company_id_t& company_id,
      const tally::schema::account_id_t& account_id,
      tally::schema::date_t start,
      tally::schema::date_t end) const;

  std::vector<tally::schema::ledger_entry_t> entries_in_range(
      const tally::schema::company_id_t& company_id,
      tally::schema::date_t start,
      tally::schema::date_t end) const;

  encoder_t& encoder() const;
  const storage_t& storage() const;

 private:
  /// Dispatch the payload to its handler inside `work`.
  tally::schema::operation_result_t execute_operation(
      unit_of_work& work,
      const tally::schema::command_t& command);

  /// Hand committed events to the sink; failures are logged only.
  void publish(const std::vector<tally::schema::audit_event_t>& events);

  unit_of_work snapshot_view() const;

  mutable std::mutex mutex_;
  mutable std::mutex sink_mutex_;
  encoder_t& encoder_;
  storage_t& storage_;
  engine_options options_;
  std::shared_ptr<tally::audit::audit_sink> audit_sink_;
};

}  // namespace tally::execution
