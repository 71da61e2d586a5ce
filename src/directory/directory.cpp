#include <tally/directory/directory.hpp>
#include <tally/execution/repository.hpp>
#include <tally/execution/result.hpp>
#include <fmt/format.h>
#include <set>

using namespace tally::schema;
using tally::execution::kDirectoryCodespace;
using tally::execution::make_error;
using tally::execution::make_success;
using tally::execution::short_id;

namespace tally::directory {

namespace {

// 100% expressed in basis points.
constexpr uint32_t kMaximumTaxRate{10'000};

}  // namespace

operation_result_t configure_company(
    tally::execution::unit_of_work& work,
    const tally::execution::command_context& context,
    const configure_company_t& command) {
  if (command.receivables_code.empty() || command.payables_code.empty() ||
      command.tax_paid_code.empty() || command.tax_collected_code.empty()) {
    return make_error(error_code::invalid_command, kDirectoryCodespace,
                      "control account codes are required");
  }
  if (command.audit_retention_days < kMinimumAuditRetentionDays) {
    return make_error(
        error_code::invalid_command, kDirectoryCodespace,
        "audit retention is shorter than the minimum",
        fmt::format("{} < {} days", command.audit_retention_days,
                    kMinimumAuditRetentionDays));
  }
  auto settings = company_settings_t{};
  settings.company_id = context.company_id;
  settings.receivables_code = command.receivables_code;
  settings.payables_code = command.payables_code;
  settings.tax_paid_code = command.tax_paid_code;
  settings.tax_collected_code = command.tax_collected_code;
  settings.audit_retention_days = command.audit_retention_days;
  tally::execution::save_company_settings(work, settings);
  return make_success(kDirectoryCodespace, "company configured",
                      context.company_id);
}

operation_result_t upsert_account(
    tally::execution::unit_of_work& work,
    const tally::execution::command_context& context,
    const upsert_account_t& command) {
  if (command.code.empty() || command.name.empty()) {
    return make_error(error_code::invalid_command, kDirectoryCodespace,
                      "account code and name are required");
  }
  if (auto holder = tally::execution::load_account_by_code(
          work, context.company_id, command.code);
      holder && holder->account_id != command.account_id) {
    return make_error(error_code::already_exists, kDirectoryCodespace,
                      "account code already used", command.code);
  }
  if (command.parent_id) {
    if (*command.parent_id == command.account_id) {
      return make_error(error_code::invalid_command, kDirectoryCodespace,
                        "account cannot be its own parent", command.code);
    }
    auto parent = tally::execution::load_account(work, context.company_id,
                                                 *command.parent_id);
    if (!parent) {
      return make_error(error_code::not_found, kDirectoryCodespace,
                        "parent account not found",
                        short_id(*command.parent_id));
    }
    auto seen = std::set<account_id_t>{parent->account_id};
    while (parent && parent->parent_id) {
      if (*parent->parent_id == command.account_id) {
        return make_error(error_code::invalid_command, kDirectoryCodespace,
                          "account hierarchy would form a cycle",
                          command.code);
      }
      if (!seen.insert(*parent->parent_id).second) {
        break;
      }
      parent = tally::execution::load_account(work, context.company_id,
                                              *parent->parent_id);
    }
  }
  if (command.is_bank && command.classification != account_class_t::asset) {
    return make_error(error_code::invalid_command, kDirectoryCodespace,
                      "bank accounts must be assets", command.code);
  }

  auto account = account_t{};
  account.company_id = context.company_id;
  account.account_id = command.account_id;
  account.code = command.code;
  account.name = command.name;
  account.classification = command.classification;
  account.active = command.active;
  account.parent_id = command.parent_id;
  account.security_level = command.security_level;
  account.is_bank = command.is_bank;
  tally::execution::save_account(work, account);
  return make_success(kDirectoryCodespace,
                      fmt::format("account {} saved", account.code),
                      account.account_id);
}

operation_result_t upsert_tax_code(
    tally::execution::unit_of_work& work,
    const tally::execution::command_context& context,
    const upsert_tax_code_t& command) {
  if (command.code.empty()) {
    return make_error(error_code::invalid_command, kDirectoryCodespace,
                      "tax code is required");
  }
  if (command.rate_basis_points > kMaximumTaxRate) {
    return make_error(error_code::invalid_command, kDirectoryCodespace,
                      "tax rate above 100%",
                      fmt::format("{} basis points",
                                  command.rate_basis_points));
  }
  auto tax_code = tax_code_t{};
  tax_code.company_id = context.company_id;
  tax_code.code = command.code;
  tax_code.name = command.name;
  tax_code.rate_basis_points = command.rate_basis_points;
  tax_code.active = command.active;
  tally::execution::save_tax_code(work, tax_code);
  return make_success(kDirectoryCodespace,
                      fmt::format("tax code {} saved", tax_code.code));
}

}  // namespace tally::directory
