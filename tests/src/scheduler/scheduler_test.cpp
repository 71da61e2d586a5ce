#include <gtest/gtest.h>
#include <tally/scheduler/recurring.hpp>
#include <tally/scheduler/scheduler.hpp>
#include <tally/schema/key/keys.hpp>
#include <tally/testing/ledger_fixture.hpp>

using tally::schema::error_code;
using tally::schema::frequency_t;
using tally::testing::ledger_fixture;

namespace {

uint32_t code_of(const error_code code) {
  return static_cast<uint32_t>(code);
}

tally::schema::upsert_recurring_template_t make_rent(
    const frequency_t frequency,
    const tally::schema::date_t first_run) {
  return tally::schema::upsert_recurring_template_t{
      .template_id = ledger_fixture::id("rent"),
      .name = "Office rent",
      .type = tally::schema::transaction_type_t::payment,
      .frequency = frequency,
      .next_run_date = first_run,
      .description = "Monthly rent",
      .lines = {ledger_fixture::debit("5000", 120000),
                ledger_fixture::credit("1000", 120000)}};
}

}  // namespace

TEST(scheduler, next_run_after_follows_the_frequency) {
  using tally::schema::make_date;
  auto start = make_date(2024, 1, 31);
  EXPECT_EQ(tally::scheduler::next_run_after(start, frequency_t::weekly),
            make_date(2024, 2, 7));
  EXPECT_EQ(tally::scheduler::next_run_after(start, frequency_t::fortnightly),
            make_date(2024, 2, 14));
  EXPECT_EQ(tally::scheduler::next_run_after(start, frequency_t::monthly),
            make_date(2024, 2, 29));
  EXPECT_EQ(tally::scheduler::next_run_after(start, frequency_t::quarterly),
            make_date(2024, 4, 30));
  EXPECT_EQ(tally::scheduler::next_run_after(start, frequency_t::yearly),
            make_date(2025, 1, 31));
}

TEST(scheduler, run_posts_and_advances_the_template) {
  auto fixture = ledger_fixture{"tally_scheduler_run"};
  ledger_fixture::expect_ok(
      fixture.execute(make_rent(frequency_t::monthly, ledger_fixture::day(1, 1))));

  auto ran = fixture.execute(tally::schema::run_recurring_template_t{
      .template_id = ledger_fixture::id("rent"),
      .run_date = ledger_fixture::day(1, 1)});
  ledger_fixture::expect_ok(ran);
  EXPECT_EQ(ran.subject_id,
            tally::schema::key::make_recurring_transaction_id(
                ledger_fixture::id("rent"), ledger_fixture::day(1, 1)));
  EXPECT_EQ(fixture.balance("5000", ledger_fixture::day(1, 31)), 120000);

  auto templates =
      fixture.engine().recurring_templates(ledger_fixture::company());
  ASSERT_EQ(templates.size(), 1u);
  EXPECT_EQ(templates[0].next_run_date, ledger_fixture::day(2, 1));
  EXPECT_EQ(templates[0].last_transaction_id, ran.subject_id);

  EXPECT_EQ(fixture
                .execute(tally::schema::run_recurring_template_t{
                    .template_id = ledger_fixture::id("rent"),
                    .run_date = ledger_fixture::day(1, 1)})
                .code,
            code_of(error_code::invalid_command));
}

TEST(scheduler, upsert_template_validates_the_schedule) {
  auto fixture = ledger_fixture{"tally_scheduler_upsert"};
  auto unnamed = make_rent(frequency_t::monthly, ledger_fixture::day(1, 1));
  unnamed.name.clear();
  EXPECT_EQ(fixture.execute(unnamed).code,
            code_of(error_code::invalid_command));

  auto ended = make_rent(frequency_t::monthly, ledger_fixture::day(3, 1));
  ended.end_date = ledger_fixture::day(2, 1);
  EXPECT_EQ(fixture.execute(ended).code, code_of(error_code::invalid_command));

  auto exhausted = make_rent(frequency_t::monthly, ledger_fixture::day(3, 1));
  exhausted.remaining_occurrences = 0;
  EXPECT_EQ(fixture.execute(exhausted).code,
            code_of(error_code::invalid_command));

  auto negative = make_rent(frequency_t::monthly, ledger_fixture::day(3, 1));
  negative.lines[0].amount = -1;
  EXPECT_EQ(fixture.execute(negative).code,
            code_of(error_code::invalid_amount));
}

TEST(scheduler, catch_up_stops_at_the_end_date) {
  auto fixture = ledger_fixture{"tally_scheduler_end_date"};
  auto rent = make_rent(frequency_t::monthly, ledger_fixture::day(1, 31));
  rent.end_date = ledger_fixture::day(4, 30);
  ledger_fixture::expect_ok(fixture.execute(rent));

  auto scheduler = tally::scheduler::scheduler{fixture.engine()};
  auto summary = scheduler.run_recurring(ledger_fixture::company(),
                                         ledger_fixture::actor(),
                                         ledger_fixture::day(12, 31),
                                         1'710'000'000'000);
  // Runs on Jan 31, Feb 29, Mar 29 and Apr 29.
  EXPECT_EQ(summary.executed, 4u);
  EXPECT_EQ(summary.failed, 0u);
  EXPECT_EQ(fixture.balance("5000", ledger_fixture::day(12, 31)), 480000);

  auto templates =
      fixture.engine().recurring_templates(ledger_fixture::company());
  ASSERT_EQ(templates.size(), 1u);
  EXPECT_FALSE(templates[0].enabled);
  EXPECT_EQ(templates[0].next_run_date, ledger_fixture::day(5, 29));

  auto again = scheduler.run_recurring(ledger_fixture::company(),
                                       ledger_fixture::actor(),
                                       ledger_fixture::day(12, 31),
                                       1'710'000'000'001);
  EXPECT_EQ(again.executed, 0u);
}

TEST(scheduler, catch_up_honours_remaining_occurrences) {
  auto fixture = ledger_fixture{"tally_scheduler_occurrences"};
  auto rent = make_rent(frequency_t::weekly, ledger_fixture::day(1, 1));
  rent.remaining_occurrences = 3;
  ledger_fixture::expect_ok(fixture.execute(rent));

  auto scheduler = tally::scheduler::scheduler{fixture.engine()};
  auto summary = scheduler.run_recurring(ledger_fixture::company(),
                                         ledger_fixture::actor(),
                                         ledger_fixture::day(6, 30),
                                         1'710'000'000'000);
  EXPECT_EQ(summary.executed, 3u);
  EXPECT_EQ(fixture.balance("1000", ledger_fixture::day(6, 30)), -360000);

  auto templates =
      fixture.engine().recurring_templates(ledger_fixture::company());
  ASSERT_EQ(templates.size(), 1u);
  EXPECT_EQ(templates[0].remaining_occurrences, std::optional<uint32_t>{0});
  EXPECT_FALSE(templates[0].enabled);
}

TEST(scheduler, failing_template_is_reported_and_stops) {
  auto fixture = ledger_fixture{"tally_scheduler_failure"};
  auto broken = make_rent(frequency_t::monthly, ledger_fixture::day(1, 1));
  broken.lines[1].amount = 1;
  ledger_fixture::expect_ok(fixture.execute(broken));

  auto scheduler = tally::scheduler::scheduler{fixture.engine()};
  auto summary = scheduler.run_recurring(ledger_fixture::company(),
                                         ledger_fixture::actor(),
                                         ledger_fixture::day(3, 31),
                                         1'710'000'000'000);
  EXPECT_EQ(summary.executed, 0u);
  EXPECT_EQ(summary.failed, 1u);

  auto templates =
      fixture.engine().recurring_templates(ledger_fixture::company());
  ASSERT_EQ(templates.size(), 1u);
  EXPECT_EQ(templates[0].next_run_date, ledger_fixture::day(1, 1));
  EXPECT_TRUE(templates[0].enabled);
}
