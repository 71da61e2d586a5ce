#pragma once

#include <tally/execution/command_context.hpp>
#include <tally/execution/unit_of_work.hpp>
#include <tally/schema/frequency.hpp>
#include <tally/schema/operation_result.hpp>
#include <tally/schema/run_recurring_template.hpp>
#include <tally/schema/upsert_recurring_template.hpp>

// Recurring transaction templates. Each run is an ordinary command: the
// transaction is created and posted through the posting engine in the same
// unit of work that advances the schedule.
namespace tally::scheduler {

/// Run date following `date` for the frequency. Month based frequencies
/// clamp to the end of shorter months.
tally::schema::date_t next_run_after(tally::schema::date_t date,
                                     tally::schema::frequency_t frequency);

tally::schema::operation_result_t upsert_recurring_template(
    tally::execution::unit_of_work& work,
    const tally::execution::command_context& context,
    const tally::schema::upsert_recurring_template_t& command);

/// Post the template's transaction for `run_date`, which must equal the
/// template's next run date, then advance the schedule. The template is
/// disabled once its remaining occurrences reach zero or its next run date
/// passes its end date.
tally::schema::operation_result_t run_recurring_template(
    tally::execution::unit_of_work& work,
    const tally::execution::command_context& context,
    const tally::schema::run_recurring_template_t& command);

}  // namespace tally::scheduler
