#pragma once

#include <tally/execution/command_context.hpp>
#include <tally/execution/unit_of_work.hpp>
#include <tally/schema/add_transaction_line.hpp>
#include <tally/schema/create_transaction.hpp>
#include <tally/schema/operation_result.hpp>
#include <tally/schema/post_transaction.hpp>
#include <tally/schema/remove_transaction_line.hpp>
#include <tally/schema/transaction_state.hpp>
#include <tally/schema/void_transaction.hpp>
#include <optional>
#include <string>

// Transaction state machine: draft --post--> posted --void--> void.
//
// Every function stages its writes on the unit of work. Validation completes
// before anything is staged, and a failed result leaves the caller to discard
// the unit, so no partial posting is ever committed.
namespace tally::posting {

struct post_options final {
  // Reversals must post even after an account was deactivated.
  bool allow_inactive_accounts{};
};

/// Post a draft transaction held by the caller.
///
/// Fails with invalid_state unless draft, empty_transaction without lines,
/// invalid_amount for a non-positive line, not_found or inactive_account for
/// line accounts, and unbalanced_transaction when debits differ from credits.
/// On success one ledger entry per line is staged, the entry sequences are
/// attached, and the transaction is saved as posted.
tally::schema::operation_result_t post(
    tally::execution::unit_of_work& work,
    const tally::execution::command_context& context,
    tally::schema::transaction_state_t& transaction,
    post_options options = {});

/// Create and post the mirror of a posted transaction, then mark the
/// original void. The reversal carries the same accounts and amounts with
/// directions flipped, so the pair nets to zero on every account.
tally::schema::operation_result_t reverse(
    tally::execution::unit_of_work& work,
    const tally::execution::command_context& context,
    tally::schema::transaction_state_t& original,
    const std::string& reason,
    std::optional<tally::schema::date_t> reversal_date);

tally::schema::operation_result_t create_transaction(
    tally::execution::unit_of_work& work,
    const tally::execution::command_context& context,
    const tally::schema::create_transaction_t& command);

tally::schema::operation_result_t add_transaction_line(
    tally::execution::unit_of_work& work,
    const tally::execution::command_context& context,
    const tally::schema::add_transaction_line_t& command);

tally::schema::operation_result_t remove_transaction_line(
    tally::execution::unit_of_work& work,
    const tally::execution::command_context& context,
    const tally::schema::remove_transaction_line_t& command);

tally::schema::operation_result_t post_transaction(
    tally::execution::unit_of_work& work,
    const tally::execution::command_context& context,
    const tally::schema::post_transaction_t& command);

/// Void a posted cash or journal transaction.
///
/// Transactions owned by a document are voided through the document.
/// Allocations sourced from the transaction block the void with
/// has_allocations unless `release_allocations` is set, in which case they
/// are removed and the documents' paid amounts recomputed in the same unit.
/// A bank feed item matched to the transaction returns to unmatched.
tally::schema::operation_result_t void_transaction(
    tally::execution::unit_of_work& work,
    const tally::execution::command_context& context,
    const tally::schema::void_transaction_t& command);

}  // namespace tally::posting
