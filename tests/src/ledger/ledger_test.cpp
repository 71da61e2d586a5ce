#include <gtest/gtest.h>
#include <tally/ledger/ledger.hpp>
#include <tally/testing/ledger_fixture.hpp>

using tally::schema::transaction_type_t;
using tally::testing::ledger_fixture;

TEST(ledger, balances_follow_the_normal_side_of_the_account) {
  auto fixture = ledger_fixture{"tally_ledger_signs"};
  ledger_fixture::expect_ok(fixture.post(
      ledger_fixture::id("capital"), transaction_type_t::journal,
      ledger_fixture::day(1, 5),
      {ledger_fixture::debit("1000", 100000),
       ledger_fixture::credit("3000", 100000)}));
  ledger_fixture::expect_ok(fixture.post(
      ledger_fixture::id("rent"), transaction_type_t::payment,
      ledger_fixture::day(1, 10),
      {ledger_fixture::debit("5000", 25000),
       ledger_fixture::credit("1000", 25000)}));

  EXPECT_EQ(fixture.balance("1000", ledger_fixture::day(1, 31)), 75000);
  EXPECT_EQ(fixture.balance("3000", ledger_fixture::day(1, 31)), 100000);
  EXPECT_EQ(fixture.balance("5000", ledger_fixture::day(1, 31)), 25000);
}

TEST(ledger, balance_as_of_ignores_later_entries) {
  auto fixture = ledger_fixture{"tally_ledger_as_of"};
  ledger_fixture::expect_ok(fixture.post(
      ledger_fixture::id("first"), transaction_type_t::journal,
      ledger_fixture::day(2, 1),
      {ledger_fixture::debit("1000", 1000),
       ledger_fixture::credit("3000", 1000)}));
  ledger_fixture::expect_ok(fixture.post(
      ledger_fixture::id("second"), transaction_type_t::journal,
      ledger_fixture::day(3, 1),
      {ledger_fixture::debit("1000", 500),
       ledger_fixture::credit("3000", 500)}));

  EXPECT_EQ(fixture.balance("1000", ledger_fixture::day(1, 31)), 0);
  EXPECT_EQ(fixture.balance("1000", ledger_fixture::day(2, 1)), 1000);
  EXPECT_EQ(fixture.balance("1000", ledger_fixture::day(3, 1)), 1500);
}

TEST(ledger, balance_of_unknown_account_is_absent) {
  auto fixture = ledger_fixture{"tally_ledger_unknown"};
  EXPECT_FALSE(fixture.engine()
                   .balance_as_of(ledger_fixture::company(),
                                  ledger_fixture::account("9999"),
                                  ledger_fixture::day(1, 1))
                   .has_value());
}

TEST(ledger, entries_in_range_are_ordered_by_date_then_sequence) {
  auto fixture = ledger_fixture{"tally_ledger_range"};
  // Posted out of date order on purpose.
  ledger_fixture::expect_ok(fixture.post(
      ledger_fixture::id("late"), transaction_type_t::journal,
      ledger_fixture::day(4, 20),
      {ledger_fixture::debit("1000", 300),
       ledger_fixture::credit("4000", 300)}));
  ledger_fixture::expect_ok(fixture.post(
      ledger_fixture::id("early"), transaction_type_t::journal,
      ledger_fixture::day(4, 2),
      {ledger_fixture::debit("1000", 100),
       ledger_fixture::credit("4000", 100)}));
  ledger_fixture::expect_ok(fixture.post(
      ledger_fixture::id("outside"), transaction_type_t::journal,
      ledger_fixture::day(5, 2),
      {ledger_fixture::debit("1000", 900),
       ledger_fixture::credit("4000", 900)}));

  auto entries = fixture.engine().entries_in_range(
      ledger_fixture::company(), ledger_fixture::account("1000"),
      ledger_fixture::day(4, 1), ledger_fixture::day(4, 30));
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0].transaction_id, ledger_fixture::id("early"));
  EXPECT_EQ(entries[0].amount_dr, 100);
  EXPECT_EQ(entries[1].transaction_id, ledger_fixture::id("late"));

  auto all = fixture.engine().entries_in_range(
      ledger_fixture::company(), ledger_fixture::day(4, 1),
      ledger_fixture::day(4, 30));
  ASSERT_EQ(all.size(), 4u);
  EXPECT_EQ(all[0].entry_date, ledger_fixture::day(4, 2));
  EXPECT_LT(all[0].sequence, all[1].sequence);
  EXPECT_EQ(all[3].entry_date, ledger_fixture::day(4, 20));
}

TEST(ledger, each_entry_carries_exactly_one_side) {
  auto fixture = ledger_fixture{"tally_ledger_sides"};
  ledger_fixture::expect_ok(fixture.post(
      ledger_fixture::id("split"), transaction_type_t::journal,
      ledger_fixture::day(6, 1),
      {ledger_fixture::line("5000", 700, tally::schema::direction_t::debit,
                            "sales"),
       ledger_fixture::debit("5000", 300),
       ledger_fixture::credit("1000", 1000)}));

  auto entries = fixture.engine().entries_in_range(
      ledger_fixture::company(), ledger_fixture::day(6, 1),
      ledger_fixture::day(6, 1));
  ASSERT_EQ(entries.size(), 3u);
  for (const auto& entry : entries) {
    EXPECT_TRUE((entry.amount_dr == 0) != (entry.amount_cr == 0));
  }
  EXPECT_EQ(entries[0].department, std::optional<std::string>{"sales"});
  auto totals = tally::ledger::sum(entries);
  EXPECT_EQ(totals.debit, totals.credit);
  EXPECT_EQ(totals.net(), 0);
}
