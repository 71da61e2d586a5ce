#pragma once

#include <tally/execution/command_context.hpp>
#include <tally/execution/unit_of_work.hpp>
#include <tally/schema/configure_company.hpp>
#include <tally/schema/operation_result.hpp>
#include <tally/schema/upsert_account.hpp>
#include <tally/schema/upsert_tax_code.hpp>

// Per-company reference data: settings, chart of accounts and tax codes.
namespace tally::directory {

/// Store control account codes and the audit retention window, which may not
/// be shorter than kMinimumAuditRetentionDays.
tally::schema::operation_result_t configure_company(
    tally::execution::unit_of_work& work,
    const tally::execution::command_context& context,
    const tally::schema::configure_company_t& command);

/// Create or replace an account. Codes are unique per company; renumbering an
/// account releases its previous code.
tally::schema::operation_result_t upsert_account(
    tally::execution::unit_of_work& work,
    const tally::execution::command_context& context,
    const tally::schema::upsert_account_t& command);

tally::schema::operation_result_t upsert_tax_code(
    tally::execution::unit_of_work& work,
    const tally::execution::command_context& context,
    const tally::schema::upsert_tax_code_t& command);

}  // namespace tally::directory
