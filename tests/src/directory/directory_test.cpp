#include <gtest/gtest.h>
#include <tally/testing/ledger_fixture.hpp>

using tally::schema::account_class_t;
using tally::schema::error_code;
using tally::testing::ledger_fixture;

namespace {

uint32_t code_of(const error_code code) {
  return static_cast<uint32_t>(code);
}

}  // namespace

TEST(directory, company_settings_default_to_standard_control_codes) {
  auto fixture = ledger_fixture{"tally_directory_defaults"};
  auto settings = fixture.engine().company_settings(ledger_fixture::company());
  EXPECT_EQ(settings.receivables_code, "1100");
  EXPECT_EQ(settings.payables_code, "2100");
  EXPECT_EQ(settings.tax_collected_code, "2200");
  EXPECT_EQ(settings.audit_retention_days,
            tally::schema::kDefaultAuditRetentionDays);

  ledger_fixture::expect_ok(fixture.execute(tally::schema::configure_company_t{
      .receivables_code = "1101", .audit_retention_days = 365}));
  settings = fixture.engine().company_settings(ledger_fixture::company());
  EXPECT_EQ(settings.receivables_code, "1101");
  EXPECT_EQ(settings.audit_retention_days, 365u);

  EXPECT_EQ(fixture
                .execute(tally::schema::configure_company_t{.payables_code = ""})
                .code,
            code_of(error_code::invalid_command));
}

TEST(directory, account_codes_are_unique_per_company) {
  auto fixture = ledger_fixture{"tally_directory_unique"};
  auto result = fixture.execute(tally::schema::upsert_account_t{
      .account_id = ledger_fixture::account("another"),
      .code = "1000",
      .name = "Second bank",
      .classification = account_class_t::asset});
  EXPECT_EQ(result.code, code_of(error_code::already_exists));
  EXPECT_EQ(result.codespace, "tally.directory");
}

TEST(directory, renaming_a_code_releases_the_old_one) {
  auto fixture = ledger_fixture{"tally_directory_rename"};
  ledger_fixture::expect_ok(fixture.execute(tally::schema::upsert_account_t{
      .account_id = ledger_fixture::account("5000"),
      .code = "5010",
      .name = "General expenses",
      .classification = account_class_t::expense}));

  EXPECT_FALSE(fixture.engine()
                   .find_account_by_code(ledger_fixture::company(), "5000")
                   .has_value());
  auto renamed = fixture.engine().find_account_by_code(
      ledger_fixture::company(), "5010");
  ASSERT_TRUE(renamed.has_value());
  EXPECT_EQ(renamed->account_id, ledger_fixture::account("5000"));
  EXPECT_EQ(renamed->name, "General expenses");
}

TEST(directory, parent_must_exist_and_differ) {
  auto fixture = ledger_fixture{"tally_directory_parent"};
  EXPECT_EQ(fixture
                .execute(tally::schema::upsert_account_t{
                    .account_id = ledger_fixture::account("1010"),
                    .code = "1010",
                    .name = "Petty cash",
                    .parent_id = ledger_fixture::account("1010")})
                .code,
            code_of(error_code::invalid_command));
  EXPECT_EQ(fixture
                .execute(tally::schema::upsert_account_t{
                    .account_id = ledger_fixture::account("1010"),
                    .code = "1010",
                    .name = "Petty cash",
                    .parent_id = ledger_fixture::account("1999")})
                .code,
            code_of(error_code::not_found));
  ledger_fixture::expect_ok(fixture.execute(tally::schema::upsert_account_t{
      .account_id = ledger_fixture::account("1010"),
      .code = "1010",
      .name = "Petty cash",
      .parent_id = ledger_fixture::account("1000")}));
  auto account = fixture.engine().find_account(
      ledger_fixture::company(), ledger_fixture::account("1010"));
  ASSERT_TRUE(account.has_value());
  EXPECT_EQ(account->parent_id,
            std::optional<tally::schema::account_id_t>{
                ledger_fixture::account("1000")});
}

TEST(directory, parent_chain_cannot_loop_back) {
  auto fixture = ledger_fixture{"tally_directory_cycle"};
  ledger_fixture::expect_ok(fixture.execute(tally::schema::upsert_account_t{
      .account_id = ledger_fixture::account("1010"),
      .code = "1010",
      .name = "Petty cash",
      .classification = account_class_t::asset,
      .parent_id = ledger_fixture::account("1000")}));
  ledger_fixture::expect_ok(fixture.execute(tally::schema::upsert_account_t{
      .account_id = ledger_fixture::account("1020"),
      .code = "1020",
      .name = "Till float",
      .classification = account_class_t::asset,
      .parent_id = ledger_fixture::account("1010")}));

  auto bank = tally::schema::upsert_account_t{
      .account_id = ledger_fixture::account("1000"),
      .code = "1000",
      .name = "Bank",
      .classification = account_class_t::asset,
      .active = true,
      .is_bank = true};
  bank.parent_id = ledger_fixture::account("1010");
  EXPECT_EQ(fixture.execute(bank).code, code_of(error_code::invalid_command));
  bank.parent_id = ledger_fixture::account("1020");
  EXPECT_EQ(fixture.execute(bank).code, code_of(error_code::invalid_command));

  auto account = fixture.engine().find_account(
      ledger_fixture::company(), ledger_fixture::account("1000"));
  ASSERT_TRUE(account.has_value());
  EXPECT_FALSE(account->parent_id.has_value());
}

TEST(directory, bank_accounts_must_be_assets) {
  auto fixture = ledger_fixture{"tally_directory_bank"};
  EXPECT_EQ(fixture
                .execute(tally::schema::upsert_account_t{
                    .account_id = ledger_fixture::account("2300"),
                    .code = "2300",
                    .name = "Overdraft",
                    .classification = account_class_t::liability,
                    .is_bank = true})
                .code,
            code_of(error_code::invalid_command));
}

TEST(directory, tax_rates_are_capped_at_one_hundred_percent) {
  auto fixture = ledger_fixture{"tally_directory_tax"};
  EXPECT_EQ(fixture
                .execute(tally::schema::upsert_tax_code_t{
                    .code = "BAD", .rate_basis_points = 10'001})
                .code,
            code_of(error_code::invalid_command));
  EXPECT_EQ(fixture.execute(tally::schema::upsert_tax_code_t{.code = ""}).code,
            code_of(error_code::invalid_command));
  ledger_fixture::expect_ok(fixture.execute(tally::schema::upsert_tax_code_t{
      .code = "ZERO", .name = "Zero rated", .rate_basis_points = 0}));
}
