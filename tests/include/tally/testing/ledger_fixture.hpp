#pragma once

#include <tally/blake3/hash.hpp>
#include <tally/execution/engine.hpp>
#include <tally/execution/unit_of_work.hpp>
#include <tally/schema/command.hpp>
#include <tally/schema/date.hpp>
#include <tally/testing/common.hpp>

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tally::testing {

/// Engine over a fresh database seeded with a small chart of accounts:
///
///   1000 Bank (bank)        1100 Receivables      1150 GST paid
///   2100 Payables           2200 GST collected    3000 Owner equity
///   4000 Sales              5000 Expenses         5100 Payroll (level 2)
///
/// and a GST tax code at 15%.
class ledger_fixture final {
 public:
  explicit ledger_fixture(const std::string_view db_prefix,
                          const tally::execution::engine_options options = {})
      : database_{db_prefix}, engine_{encoder_, database_.storage(), options} {
    seed_account("1000", "Bank", tally::schema::account_class_t::asset, true);
    seed_account("1100", "Receivables", tally::schema::account_class_t::asset);
    seed_account("1150", "GST paid", tally::schema::account_class_t::asset);
    seed_account("2100", "Payables", tally::schema::account_class_t::liability);
    seed_account("2200", "GST collected",
                 tally::schema::account_class_t::liability);
    seed_account("3000", "Owner equity", tally::schema::account_class_t::equity);
    seed_account("4000", "Sales", tally::schema::account_class_t::income);
    seed_account("5000", "Expenses", tally::schema::account_class_t::expense);
    seed_account("5100", "Payroll", tally::schema::account_class_t::expense,
                 false, 2);
    expect_ok(execute(tally::schema::upsert_tax_code_t{
        .code = "GST", .name = "Goods and services tax",
        .rate_basis_points = 1500}));
  }

  ledger_fixture(const ledger_fixture&) = delete;
  ledger_fixture& operator=(const ledger_fixture&) = delete;

  tally::execution::engine& engine() { return engine_; }
  tally::execution::encoder_t& encoder() { return encoder_; }
  tally::execution::storage_t& storage() { return database_.storage(); }

  static tally::schema::company_id_t company() { return make_hash(1); }
  static tally::schema::actor_id_t actor() { return make_hash(2); }

  static tally::schema::account_id_t account(const std::string_view code) {
    return tally::blake3::hash(std::string{"account:"} + std::string{code});
  }

  static tally::schema::hash32_t id(const std::string_view name) {
    return tally::blake3::hash(name);
  }

  static tally::schema::date_t day(const uint32_t month, const uint32_t day) {
    return tally::schema::make_date(2024, month, day);
  }

  /// Read view over the committed state.
  tally::execution::unit_of_work view() {
    return tally::execution::unit_of_work{
        encoder_, database_.storage(),
        tally::execution::unit_of_work::read_only};
  }

  tally::schema::operation_result_t execute(
      tally::schema::command_payload_t payload) {
    auto command = tally::schema::command_t{};
    command.company_id = company();
    command.actor = actor();
    command.issued_at = ++clock_;
    command.payload = std::move(payload);
    return engine_.execute(command);
  }

  static void expect_ok(const tally::schema::operation_result_t& result) {
    EXPECT_EQ(result.code, 0u) << result.codespace << ": " << result.log
                               << " " << result.info;
  }

  static tally::schema::transaction_line_t line(
      const std::string_view code,
      const tally::schema::amount_t amount,
      const tally::schema::direction_t direction,
      std::optional<std::string> department = std::nullopt) {
    return tally::schema::transaction_line_t{.account_id = account(code),
                                             .amount = amount,
                                             .direction = direction,
                                             .department =
                                                 std::move(department)};
  }

  static tally::schema::transaction_line_t debit(
      const std::string_view code,
      const tally::schema::amount_t amount) {
    return line(code, amount, tally::schema::direction_t::debit);
  }

  static tally::schema::transaction_line_t credit(
      const std::string_view code,
      const tally::schema::amount_t amount) {
    return line(code, amount, tally::schema::direction_t::credit);
  }

  /// Create and post a transaction, returning the post result.
  tally::schema::operation_result_t post(
      const tally::schema::transaction_id_t& transaction_id,
      const tally::schema::transaction_type_t type,
      const tally::schema::date_t date,
      std::vector<tally::schema::transaction_line_t> lines) {
    auto created = execute(tally::schema::create_transaction_t{
        .transaction_id = transaction_id,
        .type = type,
        .date = date,
        .lines = std::move(lines)});
    if (created.code != 0) {
      return created;
    }
    return execute(
        tally::schema::post_transaction_t{.transaction_id = transaction_id});
  }

  /// Create and post a single-line document.
  tally::schema::operation_result_t post_document(
      const tally::schema::document_id_t& document_id,
      const tally::schema::document_kind_t kind,
      const std::string& number,
      const std::string& contact,
      const tally::schema::date_t issue_date,
      const tally::schema::date_t due_date,
      const std::string_view line_account,
      const tally::schema::amount_t net,
      const tally::schema::amount_t tax) {
    auto document_line = tally::schema::document_line_t{};
    document_line.account_id = account(line_account);
    document_line.description = number;
    document_line.net_amount = net;
    document_line.tax_amount = tax;
    if (tax > 0) {
      document_line.tax_code = "GST";
    }
    auto created = execute(tally::schema::create_document_t{
        .document_id = document_id,
        .kind = kind,
        .number = number,
        .contact = contact,
        .issue_date = issue_date,
        .due_date = due_date,
        .lines = {document_line}});
    if (created.code != 0) {
      return created;
    }
    return execute(tally::schema::post_document_t{.document_id = document_id});
  }

  tally::schema::amount_t balance(const std::string_view code,
                                  const tally::schema::date_t as_of) {
    return engine_.balance_as_of(company(), account(code), as_of).value_or(0);
  }

 private:
  void seed_account(const std::string_view code,
                    const std::string_view name,
                    const tally::schema::account_class_t classification,
                    const bool is_bank = false,
                    const std::optional<uint32_t> security_level = std::nullopt) {
    expect_ok(execute(tally::schema::upsert_account_t{
        .account_id = account(code),
        .code = std::string{code},
        .name = std::string{name},
        .classification = classification,
        .active = true,
        .security_level = security_level,
        .is_bank = is_bank}));
  }

  temp_database database_;
  tally::execution::encoder_t encoder_{};
  tally::execution::engine engine_;
  tally::schema::timestamp_milliseconds_t clock_{1'700'000'000'000};
};

}  // namespace tally::testing
