#pragma once

#include <tally/execution/command_context.hpp>
#include <tally/execution/unit_of_work.hpp>
#include <tally/schema/allocate.hpp>
#include <tally/schema/document_state.hpp>
#include <tally/schema/operation_result.hpp>
#include <tally/schema/transaction_state.hpp>
#include <tally/schema/unallocate.hpp>

// Allocation of cash transactions (and posted notes) to documents.
//
// Allocation rows are the source of truth; a document's amount_paid is a
// cache recomputed from its rows inside the same unit of work whenever a row
// is added or removed.
namespace tally::allocation {

/// Cash moved by a transaction. Posted transactions balance, so this is the
/// debit total.
tally::schema::amount_t cash_amount(
    const tally::schema::transaction_state_t& transaction);

/// Cash amount less everything already allocated from the transaction.
tally::schema::amount_t unallocated_amount(
    const tally::execution::unit_of_work& work,
    const tally::schema::transaction_state_t& transaction);

/// Allocate part of a receipt to a sales invoice or part of a payment to a
/// supplier bill.
///
/// Fails with invalid_amount, not_found, invalid_state (either side not
/// posted, or the source is a reversal or a document posting),
/// type_mismatch, already_allocated, and over_allocation when the amount
/// exceeds the document balance or the unallocated cash.
tally::schema::operation_result_t allocate(
    tally::execution::unit_of_work& work,
    const tally::execution::command_context& context,
    const tally::schema::allocate_t& command);

/// Remove a cash allocation. Allocations created by a note are refused with
/// invalid_state; they disappear when the note is voided.
tally::schema::operation_result_t unallocate(
    tally::execution::unit_of_work& work,
    const tally::execution::command_context& context,
    const tally::schema::unallocate_t& command);

/// Remove every allocation sourced from `transaction` and refresh the
/// documents it paid.
tally::schema::operation_result_t release_source_allocations(
    tally::execution::unit_of_work& work,
    const tally::execution::command_context& context,
    const tally::schema::transaction_state_t& transaction);

/// Allocate a freshly posted note against its original document for the
/// note total, dated at the note's issue date.
tally::schema::operation_result_t apply_note(
    tally::execution::unit_of_work& work,
    const tally::execution::command_context& context,
    const tally::schema::document_state_t& note);

/// Remove the allocation a note holds against its original document.
tally::schema::operation_result_t release_note(
    tally::execution::unit_of_work& work,
    const tally::execution::command_context& context,
    const tally::schema::document_state_t& note);

/// Recompute amount_paid from the document's allocation rows and save it.
/// Returns false when the document revision moved underneath the caller.
[[nodiscard]] bool refresh_amount_paid(
    tally::execution::unit_of_work& work,
    tally::schema::document_state_t& document);

}  // namespace tally::allocation
