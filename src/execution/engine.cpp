#include <spdlog/spdlog.h>
#include <tally/allocation/allocation_engine.hpp>
#include <tally/audit/storage_audit_sink.hpp>
#include <tally/directory/directory.hpp>
#include <tally/execution/command_context.hpp>
#include <tally/execution/engine.hpp>
#include <tally/execution/repository.hpp>
#include <tally/execution/result.hpp>
#include <tally/ledger/ledger.hpp>
#include <tally/posting/document_posting.hpp>
#include <tally/posting/posting_engine.hpp>
#include <tally/reconciliation/bank_feed.hpp>
#include <tally/scheduler/recurring.hpp>
#include <array>
#include <exception>
#include <utility>

using namespace tally::schema;

namespace {

// Indexed by command_payload_t alternative.
constexpr auto kCommandNames = std::array<std::string_view, 22>{
    "configure_company",       "upsert_account",
    "upsert_tax_code",         "create_transaction",
    "add_transaction_line",    "remove_transaction_line",
    "post_transaction",        "void_transaction",
    "create_document",         "create_note",
    "add_document_line",       "remove_document_line",
    "post_document",           "void_document",
    "allocate",                "unallocate",
    "import_bank_statement",   "match_feed_item",
    "ignore_feed_item",        "upsert_matching_rule",
    "upsert_recurring_template", "run_recurring_template"};

static_assert(kCommandNames.size() == std::variant_size_v<command_payload_t>);

std::string_view command_name(const command_payload_t& payload) {
  return kCommandNames[payload.index()];
}

}  // namespace

namespace tally::execution {

engine::engine(encoder_t& encoder, storage_t& storage, engine_options options)
    : encoder_{encoder},
      storage_{storage},
      options_{options},
      audit_sink_{
          std::make_shared<tally::audit::storage_audit_sink>(encoder, storage)} {
  if (options_.match_window_days == 0) {
    spdlog::warn("Match window is 0 days; only same-day transactions match");
  }
  spdlog::info("Ledger engine ready (match window {} days)",
               options_.match_window_days);
}

operation_result_t engine::execute(const command_t& command) {
  auto payload_version = std::visit(
      [](const auto& payload) { return payload.version; }, command.payload);
  if (command.version != 1 || payload_version != 1) {
    return make_error(error_code::unsupported_version, kEngineCodespace,
                      "unsupported command version", "expected version 1");
  }

  auto result = operation_result_t{};
  auto events = std::vector<audit_event_t>{};
  {
    auto lock = std::scoped_lock{mutex_};
    auto work = unit_of_work{encoder_, storage_};
    result = execute_operation(work, command);
    if (result.code != 0) {
      spdlog::warn("Rejected {} ({}/{}): {} {}",
                   command_name(command.payload), result.codespace,
                   result.code, result.log, result.info);
      return result;
    }
    work.commit();
    events = work.events();
  }
  spdlog::info("Committed {}: {}", command_name(command.payload), result.info);
  publish(events);
  return result;
}

operation_result_t engine::execute(const bytes_view_t& raw_command) {
  if (raw_command.empty()) {
    return make_error(error_code::invalid_command, kEngineCodespace,
                      "empty command");
  }
  auto command = encoder_.try_decode<command_t>(raw_command);
  if (!command) {
    return make_error(error_code::invalid_command, kEngineCodespace,
                      "invalid command", "failed to decode SCALE bytes");
  }
  return execute(*command);
}

operation_result_t engine::execute_operation(unit_of_work& work,
                                             const command_t& command) {
  auto context = command_context{.company_id = command.company_id,
                                 .actor = command.actor,
                                 .issued_at = command.issued_at};
  auto match_options = tally::reconciliation::match_options{
      .window_days = options_.match_window_days};
  return std::visit(
      overloaded{
          [&](const configure_company_t& payload) {
            return tally::directory::configure_company(work, context, payload);
          },
          [&](const upsert_account_t& payload) {
            return tally::directory::upsert_account(work, context, payload);
          },
          [&](const upsert_tax_code_t& payload) {
            return tally::directory::upsert_tax_code(work, context, payload);
          },
          [&](const create_transaction_t& payload) {
            return tally::posting::create_transaction(work, context, payload);
          },
          [&](const add_transaction_line_t& payload) {
            return tally::posting::add_transaction_line(work, context,
                                                        payload);
          },
          [&](const remove_transaction_line_t& payload) {
            return tally::posting::remove_transaction_line(work, context,
                                                           payload);
          },
          [&](const post_transaction_t& payload) {
            return tally::posting::post_transaction(work, context, payload);
          },
          [&](const void_transaction_t& payload) {
            return tally::posting::void_transaction(work, context, payload);
          },
          [&](const create_document_t& payload) {
            return tally::posting::create_document(work, context, payload);
          },
          [&](const create_note_t& payload) {
            return tally::posting::create_note(work, context, payload);
          },
          [&](const add_document_line_t& payload) {
            return tally::posting::add_document_line(work, context, payload);
          },
          [&](const remove_document_line_t& payload) {
            return tally::posting::remove_document_line(work, context,
                                                        payload);
          },
          [&](const post_document_t& payload) {
            return tally::posting::post_document(work, context, payload);
          },
          [&](const void_document_t& payload) {
            return tally::posting::void_document(work, context, payload);
          },
          [&](const allocate_t& payload) {
            return tally::allocation::allocate(work, context, payload);
          },
          [&](const unallocate_t& payload) {
            return tally::allocation::unallocate(work, context, payload);
          },
          [&](const import_bank_statement_t& payload) {
            return tally::reconciliation::import_statement(work, context,
                                                           payload);
          },
          [&](const match_feed_item_t& payload) {
            return tally::reconciliation::match_item(work, context, payload,
                                                     match_options);
          },
          [&](const ignore_feed_item_t& payload) {
            return tally::reconciliation::ignore_item(work, context, payload);
          },
          [&](const upsert_matching_rule_t& payload) {
            return tally::reconciliation::upsert_rule(work, context, payload);
          },
          [&](const upsert_recurring_template_t& payload) {
            return tally::scheduler::upsert_recurring_template(work, context,
                                                               payload);
          },
          [&](const run_recurring_template_t& payload) {
            return tally::scheduler::run_recurring_template(work, context,
                                                            payload);
          }},
      command.payload);
}

void engine::set_audit_sink(std::shared_ptr<tally::audit::audit_sink> sink) {
  auto lock = std::scoped_lock{sink_mutex_};
  audit_sink_ = std::move(sink);
}

void engine::publish(const std::vector<audit_event_t>& events) {
  auto sink = std::shared_ptr<tally::audit::audit_sink>{};
  {
    auto lock = std::scoped_lock{sink_mutex_};
    sink = audit_sink_;
  }
  if (!sink) {
    return;
  }
  for (const auto& event : events) {
    try {
      sink->record(event);
    } catch (const std::exception& ex) {
      spdlog::warn("Audit sink failed to record {} for {}: {}",
                   to_string(event.action), short_id(event.subject_id),
                   ex.what());
    }
  }
}

std::size_t engine::enforce_retention(const company_id_t& company_id,
                                      const timestamp_milliseconds_t now) {
  auto settings = company_settings(company_id);
  return tally::audit::purge_expired_events(
      encoder_, storage_, company_id, settings.audit_retention_days, now);
}

unit_of_work engine::snapshot_view() const {
  return unit_of_work{encoder_, storage_, unit_of_work::read_only};
}

company_settings_t engine::company_settings(
    const company_id_t& company_id) const {
  auto work = snapshot_view();
  return load_company_settings(work, company_id);
}

std::optional<account_t> engine::find_account(
    const company_id_t& company_id,
    const account_id_t& account_id) const {
  auto work = snapshot_view();
  return load_account(work, company_id, account_id);
}

std::optional<account_t> engine::find_account_by_code(
    const company_id_t& company_id,
    std::string_view code) const {
  auto work = snapshot_view();
  return load_account_by_code(work, company_id, code);
}

std::optional<transaction_state_t> engine::find_transaction(
    const company_id_t& company_id,
    const transaction_id_t& transaction_id) const {
  auto work = snapshot_view();
  return load_transaction(work, company_id, transaction_id);
}

std::optional<document_state_t> engine::find_document(
    const company_id_t& company_id,
    const document_id_t& document_id) const {
  auto work = snapshot_view();
  return load_document(work, company_id, document_id);
}

std::vector<allocation_t> engine::allocations_for_document(
    const company_id_t& company_id,
    const document_id_t& document_id) const {
  auto work = snapshot_view();
  return load_allocations_for_document(work, company_id, document_id);
}

std::optional<bank_feed_item_t> engine::find_feed_item(
    const company_id_t& company_id,
    const hash32_t& import_id,
    std::string_view fit_id) const {
  auto work = snapshot_view();
  return load_feed_item(work, company_id, import_id, fit_id);
}

std::vector<bank_feed_item_t> engine::feed_items_for_import(
    const company_id_t& company_id,
    const hash32_t& import_id) const {
  auto work = snapshot_view();
  return load_feed_items_for_import(work, company_id, import_id);
}

std::vector<recurring_template_t> engine::recurring_templates(
    const company_id_t& company_id) const {
  auto work = snapshot_view();
  return load_recurring_templates(work, company_id);
}

std::optional<amount_t> engine::unallocated_amount(
    const company_id_t& company_id,
    const transaction_id_t& transaction_id) const {
  auto work = snapshot_view();
  auto transaction = load_transaction(work, company_id, transaction_id);
  if (!transaction) {
    return std::nullopt;
  }
  return tally::allocation::unallocated_amount(work, *transaction);
}

std::optional<amount_t> engine::balance_as_of(const company_id_t& company_id,
                                              const account_id_t& account_id,
                                              const date_t as_of) const {
  auto work = snapshot_view();
  return tally::ledger::balance_as_of(work, company_id, account_id, as_of);
}

std::vector<ledger_entry_t> engine::entries_in_range(
    const company_id_t& company_id,
    const account_id_t& account_id,
    const date_t start,
    const date_t end) const {
  auto work = snapshot_view();
  return tally::ledger::entries_in_range(work, company_id, account_id, start,
                                         end);
}

std::vector<ledger_entry_t> engine::entries_in_range(
    const company_id_t& company_id,
    const date_t start,
    const date_t end) const {
  auto work = snapshot_view();
  return tally::ledger::entries_in_range(work, company_id, start, end);
}

encoder_t& engine::encoder() const {
  return encoder_;
}

const storage_t& engine::storage() const {
  return storage_;
}

}  // namespace tally::execution
