#include <gtest/gtest.h>
#include <tally/reconciliation/bank_feed.hpp>
#include <tally/schema/key/keys.hpp>
#include <tally/testing/ledger_fixture.hpp>

#include <algorithm>
#include <limits>
#include <string>
#include <vector>

using tally::schema::error_code;
using tally::schema::feed_item_status_t;
using tally::schema::transaction_type_t;
using tally::testing::ledger_fixture;

namespace {

uint32_t code_of(const error_code code) {
  return static_cast<uint32_t>(code);
}

tally::schema::bank_feed_line_t make_line(const std::string& fit_id,
                                          const tally::schema::date_t date,
                                          const tally::schema::amount_t amount,
                                          const std::string& description) {
  return tally::schema::bank_feed_line_t{.fit_id = fit_id,
                                         .posted_date = date,
                                         .amount = amount,
                                         .description = description};
}

tally::schema::import_bank_statement_t make_import(
    const std::string_view import_name,
    const std::string_view file,
    std::vector<tally::schema::bank_feed_line_t> items) {
  return tally::schema::import_bank_statement_t{
      .import_id = ledger_fixture::id(import_name),
      .bank_account_id = ledger_fixture::account("1000"),
      .source_type = tally::schema::statement_source_t::ofx,
      .source_name = std::string{file},
      .file_hash = ledger_fixture::id(file),
      .items = std::move(items)};
}

tally::schema::match_feed_item_t make_match(
    const std::string_view import_name,
    const std::string& fit_id,
    std::optional<tally::schema::transaction_id_t> transaction_id =
        std::nullopt) {
  return tally::schema::match_feed_item_t{
      .import_id = ledger_fixture::id(import_name),
      .fit_id = fit_id,
      .transaction_id = transaction_id};
}

}  // namespace

TEST(bank_feed, import_inserts_new_items_and_skips_known_ones) {
  auto fixture = ledger_fixture{"tally_feed_import"};
  auto first = fixture.execute(make_import(
      "march", "march.ofx",
      {make_line("A1", ledger_fixture::day(3, 1), -2500, "Coffee"),
       make_line("A2", ledger_fixture::day(3, 2), 10000, "Deposit")}));
  ledger_fixture::expect_ok(first);
  EXPECT_EQ(first.info, "inserted 2 skipped 0");

  auto rerun = fixture.execute(make_import(
      "march", "march.ofx",
      {make_line("A2", ledger_fixture::day(3, 2), 10000, "Deposit"),
       make_line("A3", ledger_fixture::day(3, 3), -700, "Bus")}));
  ledger_fixture::expect_ok(rerun);
  EXPECT_EQ(rerun.info, "inserted 1 skipped 1");

  auto item = fixture.engine().find_feed_item(
      ledger_fixture::company(), ledger_fixture::id("march"), "A3");
  ASSERT_TRUE(item.has_value());
  EXPECT_EQ(item->status, feed_item_status_t::unmatched);
  EXPECT_EQ(item->amount, -700);

  auto items = fixture.engine().feed_items_for_import(
      ledger_fixture::company(), ledger_fixture::id("march"));
  auto fit_ids = std::vector<std::string>{};
  for (const auto& entry : items) {
    fit_ids.push_back(entry.fit_id);
  }
  std::sort(fit_ids.begin(), fit_ids.end());
  EXPECT_EQ(fit_ids, (std::vector<std::string>{"A1", "A2", "A3"}));
  EXPECT_TRUE(fixture.engine()
                  .feed_items_for_import(ledger_fixture::company(),
                                         ledger_fixture::id("april"))
                  .empty());
}

TEST(bank_feed, same_file_under_another_import_is_a_duplicate) {
  auto fixture = ledger_fixture{"tally_feed_duplicate"};
  ledger_fixture::expect_ok(fixture.execute(make_import(
      "march", "march.ofx",
      {make_line("A1", ledger_fixture::day(3, 1), -2500, "Coffee")})));
  auto duplicate = fixture.execute(make_import(
      "march-again", "march.ofx",
      {make_line("A1", ledger_fixture::day(3, 1), -2500, "Coffee")}));
  EXPECT_EQ(duplicate.code, code_of(error_code::duplicate_import));
  EXPECT_FALSE(fixture.engine()
                   .find_feed_item(ledger_fixture::company(),
                                   ledger_fixture::id("march-again"), "A1")
                   .has_value());
}

TEST(bank_feed, import_requires_a_bank_account_and_fit_ids) {
  auto fixture = ledger_fixture{"tally_feed_import_checks"};
  auto not_bank = make_import("x", "x.ofx", {});
  not_bank.bank_account_id = ledger_fixture::account("1100");
  EXPECT_EQ(fixture.execute(not_bank).code,
            code_of(error_code::invalid_command));

  EXPECT_EQ(fixture
                .execute(make_import(
                    "y", "y.ofx",
                    {make_line("", ledger_fixture::day(3, 1), -1, "blank")}))
                .code,
            code_of(error_code::invalid_command));
}

TEST(bank_feed, import_rejects_unpostable_amounts) {
  auto fixture = ledger_fixture{"tally_feed_import_amounts"};
  EXPECT_EQ(fixture
                .execute(make_import(
                    "zero", "zero.ofx",
                    {make_line("Z1", ledger_fixture::day(3, 1), 500, "Fine"),
                     make_line("Z2", ledger_fixture::day(3, 1), 0, "Nil")}))
                .code,
            code_of(error_code::invalid_amount));
  EXPECT_EQ(fixture
                .execute(make_import(
                    "min", "min.ofx",
                    {make_line("M1", ledger_fixture::day(3, 1),
                               std::numeric_limits<tally::schema::amount_t>::min(),
                               "Overflow")}))
                .code,
            code_of(error_code::invalid_amount));
  EXPECT_FALSE(fixture.engine()
                   .find_feed_item(ledger_fixture::company(),
                                   ledger_fixture::id("zero"), "Z1")
                   .has_value());
}

TEST(bank_feed, explicit_match_checks_the_bank_movement) {
  auto fixture = ledger_fixture{"tally_feed_explicit"};
  ledger_fixture::expect_ok(fixture.post(
      ledger_fixture::id("coffee"), transaction_type_t::payment,
      ledger_fixture::day(3, 1),
      {ledger_fixture::debit("5000", 2500),
       ledger_fixture::credit("1000", 2500)}));
  ledger_fixture::expect_ok(fixture.execute(make_import(
      "march", "march.ofx",
      {make_line("A1", ledger_fixture::day(3, 1), -2500, "Coffee"),
       make_line("A2", ledger_fixture::day(3, 1), 2500, "Refund")})));

  EXPECT_EQ(fixture
                .execute(make_match("march", "A2", ledger_fixture::id("coffee")))
                .code,
            code_of(error_code::amount_mismatch));
  EXPECT_EQ(fixture
                .execute(
                    make_match("march", "A1", ledger_fixture::id("missing")))
                .code,
            code_of(error_code::not_found));

  auto matched =
      fixture.execute(make_match("march", "A1", ledger_fixture::id("coffee")));
  ledger_fixture::expect_ok(matched);
  auto item = fixture.engine().find_feed_item(
      ledger_fixture::company(), ledger_fixture::id("march"), "A1");
  ASSERT_TRUE(item.has_value());
  EXPECT_EQ(item->status, feed_item_status_t::matched);
  EXPECT_EQ(item->matched_transaction_id, ledger_fixture::id("coffee"));
  EXPECT_FALSE(item->matched_rule_id.has_value());

  EXPECT_EQ(fixture.execute(make_match("march", "A1")).code,
            code_of(error_code::invalid_state));
}

TEST(bank_feed, automatic_match_prefers_an_existing_transaction) {
  auto fixture = ledger_fixture{"tally_feed_auto"};
  ledger_fixture::expect_ok(fixture.post(
      ledger_fixture::id("coffee"), transaction_type_t::payment,
      ledger_fixture::day(3, 2),
      {ledger_fixture::debit("5000", 2500),
       ledger_fixture::credit("1000", 2500)}));
  ledger_fixture::expect_ok(fixture.execute(make_import(
      "march", "march.ofx",
      {make_line("A1", ledger_fixture::day(3, 4), -2500, "Coffee"),
       make_line("A2", ledger_fixture::day(3, 4), -2500, "Coffee again")})));

  auto matched = fixture.execute(make_match("march", "A1"));
  ledger_fixture::expect_ok(matched);
  EXPECT_EQ(matched.subject_id, ledger_fixture::id("coffee"));

  // The only candidate is taken, and there is no rule.
  EXPECT_EQ(fixture.execute(make_match("march", "A2")).code,
            code_of(error_code::no_match));
}

TEST(bank_feed, rule_hit_posts_a_coded_transaction) {
  auto fixture = ledger_fixture{"tally_feed_rule"};
  ledger_fixture::expect_ok(fixture.execute(tally::schema::upsert_matching_rule_t{
      .rule_id = ledger_fixture::id("rule-fees"),
      .name = "Bank fees",
      .priority = 10,
      .match_expression = "CONTAINS 'fee'",
      .target_account_id = ledger_fixture::account("5000"),
      .memo_template = "Fee: {description}"}));
  ledger_fixture::expect_ok(fixture.execute(make_import(
      "march", "march.ofx",
      {make_line("F1", ledger_fixture::day(3, 31), -1200, "MONTHLY FEE")})));

  auto coded = fixture.execute(make_match("march", "F1"));
  ledger_fixture::expect_ok(coded);
  EXPECT_EQ(coded.subject_id, tally::schema::key::make_feed_transaction_id(
                                  ledger_fixture::id("march"), "F1", 0));
  EXPECT_EQ(fixture.balance("5000", ledger_fixture::day(3, 31)), 1200);
  EXPECT_EQ(fixture.balance("1000", ledger_fixture::day(3, 31)), -1200);

  auto transaction = fixture.engine().find_transaction(ledger_fixture::company(),
                                                       *coded.subject_id);
  ASSERT_TRUE(transaction.has_value());
  EXPECT_EQ(transaction->type, transaction_type_t::payment);
  EXPECT_EQ(transaction->lines[0].memo,
            std::optional<std::string>{"Fee: MONTHLY FEE"});

  auto item = fixture.engine().find_feed_item(
      ledger_fixture::company(), ledger_fixture::id("march"), "F1");
  ASSERT_TRUE(item.has_value());
  EXPECT_EQ(item->matched_rule_id, ledger_fixture::id("rule-fees"));
}

TEST(bank_feed, upsert_rule_validates_its_fields) {
  auto fixture = ledger_fixture{"tally_feed_rule_checks"};
  EXPECT_EQ(fixture
                .execute(tally::schema::upsert_matching_rule_t{
                    .rule_id = ledger_fixture::id("r"),
                    .target_account_id = ledger_fixture::account("5000")})
                .code,
            code_of(error_code::invalid_command));
  EXPECT_EQ(fixture
                .execute(tally::schema::upsert_matching_rule_t{
                    .rule_id = ledger_fixture::id("r"),
                    .name = "bounds",
                    .min_amount = 500,
                    .max_amount = 100,
                    .target_account_id = ledger_fixture::account("5000")})
                .code,
            code_of(error_code::invalid_command));
  EXPECT_EQ(fixture
                .execute(tally::schema::upsert_matching_rule_t{
                    .rule_id = ledger_fixture::id("r"),
                    .name = "nowhere",
                    .target_account_id = ledger_fixture::account("9999")})
                .code,
            code_of(error_code::not_found));
}

TEST(bank_feed, voiding_a_matched_transaction_reopens_the_item) {
  auto fixture = ledger_fixture{"tally_feed_void"};
  ledger_fixture::expect_ok(fixture.post(
      ledger_fixture::id("deposit"), transaction_type_t::receipt,
      ledger_fixture::day(3, 5),
      {ledger_fixture::debit("1000", 9000),
       ledger_fixture::credit("4000", 9000)}));
  ledger_fixture::expect_ok(fixture.execute(make_import(
      "march", "march.ofx",
      {make_line("D1", ledger_fixture::day(3, 5), 9000, "Deposit")})));
  ledger_fixture::expect_ok(fixture.execute(make_match("march", "D1")));

  ledger_fixture::expect_ok(fixture.execute(tally::schema::void_transaction_t{
      .transaction_id = ledger_fixture::id("deposit"), .reason = "bounced"}));
  auto item = fixture.engine().find_feed_item(
      ledger_fixture::company(), ledger_fixture::id("march"), "D1");
  ASSERT_TRUE(item.has_value());
  EXPECT_EQ(item->status, feed_item_status_t::unmatched);
  EXPECT_FALSE(item->matched_transaction_id.has_value());

  // A rule-coded item can be coded again once its transaction is voided.
  ledger_fixture::expect_ok(fixture.execute(tally::schema::upsert_matching_rule_t{
      .rule_id = ledger_fixture::id("rule-fees"),
      .name = "Bank fees",
      .priority = 10,
      .match_expression = "CONTAINS 'fee'",
      .target_account_id = ledger_fixture::account("5000")}));
  ledger_fixture::expect_ok(fixture.execute(make_import(
      "april", "april.ofx",
      {make_line("F1", ledger_fixture::day(4, 30), -1200, "MONTHLY FEE")})));
  auto first = fixture.execute(make_match("april", "F1"));
  ledger_fixture::expect_ok(first);
  ASSERT_TRUE(first.subject_id.has_value());
  ledger_fixture::expect_ok(fixture.execute(tally::schema::void_transaction_t{
      .transaction_id = *first.subject_id, .reason = "duplicate fee"}));
  EXPECT_EQ(fixture.balance("5000", ledger_fixture::day(4, 30)), 0);

  auto second = fixture.execute(make_match("april", "F1"));
  ledger_fixture::expect_ok(second);
  EXPECT_NE(second.subject_id, first.subject_id);
  EXPECT_EQ(second.subject_id, tally::schema::key::make_feed_transaction_id(
                                   ledger_fixture::id("april"), "F1", 1));
  EXPECT_EQ(fixture.balance("5000", ledger_fixture::day(4, 30)), 1200);
  auto recoded = fixture.engine().find_feed_item(
      ledger_fixture::company(), ledger_fixture::id("april"), "F1");
  ASSERT_TRUE(recoded.has_value());
  EXPECT_EQ(recoded->status, feed_item_status_t::matched);
  EXPECT_EQ(recoded->rule_codings, 2u);
}

TEST(bank_feed, ignored_items_leave_the_unmatched_queue) {
  auto fixture = ledger_fixture{"tally_feed_ignore"};
  ledger_fixture::expect_ok(fixture.execute(make_import(
      "march", "march.ofx",
      {make_line("B1", ledger_fixture::day(3, 9), -100, "Transfer"),
       make_line("B2", ledger_fixture::day(3, 2), -300, "Bus"),
       make_line("B3", ledger_fixture::day(3, 5), 1000, "Deposit")})));
  ledger_fixture::expect_ok(fixture.execute(tally::schema::ignore_feed_item_t{
      .import_id = ledger_fixture::id("march"), .fit_id = "B3"}));
  EXPECT_EQ(fixture
                .execute(tally::schema::ignore_feed_item_t{
                    .import_id = ledger_fixture::id("march"), .fit_id = "B3"})
                .code,
            code_of(error_code::invalid_state));

  auto view = fixture.view();
  auto summary = tally::reconciliation::summarize_unmatched(
      view, ledger_fixture::company(), ledger_fixture::account("1000"));
  EXPECT_EQ(summary.count, 2u);
  EXPECT_EQ(summary.total, -400);
  EXPECT_EQ(summary.oldest,
            std::optional<tally::schema::date_t>{ledger_fixture::day(3, 2)});

  auto oldest = tally::reconciliation::oldest_unmatched(
      view, ledger_fixture::company(), ledger_fixture::account("1000"), 1);
  ASSERT_EQ(oldest.size(), 1u);
  EXPECT_EQ(oldest[0].fit_id, "B2");
}

TEST(bank_feed, match_window_comes_from_engine_options) {
  auto fixture = ledger_fixture{
      "tally_feed_window",
      tally::execution::engine_options{.match_window_days = 0}};
  ledger_fixture::expect_ok(fixture.post(
      ledger_fixture::id("coffee"), transaction_type_t::payment,
      ledger_fixture::day(3, 2),
      {ledger_fixture::debit("5000", 2500),
       ledger_fixture::credit("1000", 2500)}));
  ledger_fixture::expect_ok(fixture.execute(make_import(
      "march", "march.ofx",
      {make_line("A1", ledger_fixture::day(3, 3), -2500, "Coffee")})));
  EXPECT_EQ(fixture.execute(make_match("march", "A1")).code,
            code_of(error_code::no_match));
}
