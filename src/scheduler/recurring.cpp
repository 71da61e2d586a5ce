#include <spdlog/spdlog.h>
#include <tally/execution/repository.hpp>
#include <tally/execution/result.hpp>
#include <tally/posting/posting_engine.hpp>
#include <tally/scheduler/recurring.hpp>
#include <tally/schema/date.hpp>
#include <tally/schema/key/keys.hpp>
#include <fmt/format.h>

using namespace tally::schema;
using tally::execution::kRecurringCodespace;
using tally::execution::make_error;
using tally::execution::make_success;
using tally::execution::short_id;

namespace tally::scheduler {

date_t next_run_after(const date_t date, const frequency_t frequency) {
  switch (frequency) {
    case frequency_t::weekly:
      return date + 7;
    case frequency_t::fortnightly:
      return date + 14;
    case frequency_t::monthly:
      return add_months(date, 1);
    case frequency_t::quarterly:
      return add_months(date, 3);
    case frequency_t::yearly:
      return add_months(date, 12);
  }
  return add_months(date, 1);
}

operation_result_t upsert_recurring_template(
    tally::execution::unit_of_work& work,
    const tally::execution::command_context& context,
    const upsert_recurring_template_t& command) {
  if (command.name.empty()) {
    return make_error(error_code::invalid_command, kRecurringCodespace,
                      "template name is required");
  }
  if (command.remaining_occurrences && *command.remaining_occurrences == 0) {
    return make_error(error_code::invalid_command, kRecurringCodespace,
                      "remaining occurrences must be positive", command.name);
  }
  if (command.end_date && *command.end_date < command.next_run_date) {
    return make_error(error_code::invalid_command, kRecurringCodespace,
                      "end date precedes the next run date", command.name);
  }
  for (const auto& line : command.lines) {
    if (line.amount <= 0) {
      return make_error(error_code::invalid_amount, kRecurringCodespace,
                        "line amount must be positive",
                        fmt::format("amount {}", line.amount));
    }
  }

  auto existing = tally::execution::load_recurring_template(
      work, context.company_id, command.template_id);
  auto recurring = recurring_template_t{};
  recurring.company_id = context.company_id;
  recurring.template_id = command.template_id;
  recurring.name = command.name;
  recurring.type = command.type;
  recurring.frequency = command.frequency;
  recurring.next_run_date = command.next_run_date;
  recurring.end_date = command.end_date;
  recurring.remaining_occurrences = command.remaining_occurrences;
  recurring.description = command.description;
  recurring.lines = command.lines;
  recurring.enabled = command.enabled;
  if (existing) {
    recurring.last_transaction_id = existing->last_transaction_id;
  }
  work.put(key::make_recurring_template_key(context.company_id,
                                            recurring.template_id),
           recurring);
  return make_success(kRecurringCodespace, "template saved",
                      recurring.template_id);
}

operation_result_t run_recurring_template(
    tally::execution::unit_of_work& work,
    const tally::execution::command_context& context,
    const run_recurring_template_t& command) {
  auto recurring = tally::execution::load_recurring_template(
      work, context.company_id, command.template_id);
  if (!recurring) {
    return make_error(error_code::not_found, kRecurringCodespace,
                      "template not found", short_id(command.template_id));
  }
  if (!recurring->enabled) {
    return make_error(error_code::invalid_state, kRecurringCodespace,
                      "template is disabled", recurring->name);
  }
  if (command.run_date != recurring->next_run_date) {
    return make_error(error_code::invalid_command, kRecurringCodespace,
                      "run date is not the template's next run date",
                      fmt::format("run {} next {}",
                                  to_iso_string(command.run_date),
                                  to_iso_string(recurring->next_run_date)));
  }
  if (recurring->end_date && command.run_date > *recurring->end_date) {
    return make_error(error_code::invalid_state, kRecurringCodespace,
                      "template schedule has ended", recurring->name);
  }

  auto transaction = transaction_state_t{};
  transaction.company_id = context.company_id;
  transaction.transaction_id =
      key::make_recurring_transaction_id(recurring->template_id,
                                         command.run_date);
  transaction.type = recurring->type;
  transaction.date = command.run_date;
  transaction.reference = recurring->name;
  transaction.description = recurring->description;
  transaction.lines = recurring->lines;
  if (tally::execution::load_transaction(work, context.company_id,
                                         transaction.transaction_id)) {
    return make_error(error_code::already_exists, kRecurringCodespace,
                      "run already posted", to_iso_string(command.run_date));
  }
  auto posted = tally::posting::post(work, context, transaction);
  if (posted.code != 0) {
    return posted;
  }

  recurring->last_transaction_id = transaction.transaction_id;
  recurring->next_run_date =
      next_run_after(recurring->next_run_date, recurring->frequency);
  if (recurring->remaining_occurrences) {
    --*recurring->remaining_occurrences;
    if (*recurring->remaining_occurrences == 0) {
      recurring->enabled = false;
    }
  }
  if (recurring->end_date && recurring->next_run_date > *recurring->end_date) {
    recurring->enabled = false;
  }
  work.put(key::make_recurring_template_key(context.company_id,
                                            recurring->template_id),
           *recurring);
  work.record(context.make_event(
      audit_action_t::recurring_executed, recurring->template_id,
      fmt::format("{} run {}", recurring->name,
                  to_iso_string(command.run_date))));
  spdlog::debug("Staged recurring run of {} for {}", recurring->name,
                to_iso_string(command.run_date));
  return make_success(kRecurringCodespace,
                      recurring->enabled
                          ? fmt::format("next run {}",
                                        to_iso_string(recurring->next_run_date))
                          : std::string{"schedule complete"},
                      transaction.transaction_id);
}

}  // namespace tally::scheduler
