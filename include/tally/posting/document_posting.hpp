#pragma once

#include <tally/execution/command_context.hpp>
#include <tally/execution/unit_of_work.hpp>
#include <tally/schema/add_document_line.hpp>
#include <tally/schema/create_document.hpp>
#include <tally/schema/create_note.hpp>
#include <tally/schema/document_state.hpp>
#include <tally/schema/operation_result.hpp>
#include <tally/schema/post_document.hpp>
#include <tally/schema/remove_document_line.hpp>
#include <tally/schema/transaction_line.hpp>
#include <tally/schema/void_document.hpp>
#include <optional>
#include <vector>

// Allocatable documents (sales invoices, supplier bills and the credit and
// debit notes raised against them) posted through the transaction engine.
namespace tally::posting {

/// Ledger lines of a document.
///
/// A sales invoice debits the control account for the total, credits each
/// line account with its net amount and credits the tax account with the tax
/// total. A supplier bill is the opposite. Notes use the lines of their base
/// kind with every direction inverted.
std::vector<tally::schema::transaction_line_t> document_lines(
    const tally::schema::document_state_t& document,
    const tally::schema::account_id_t& control_account_id,
    const std::optional<tally::schema::account_id_t>& tax_account_id);

tally::schema::operation_result_t create_document(
    tally::execution::unit_of_work& work,
    const tally::execution::command_context& context,
    const tally::schema::create_document_t& command);

/// Raise a credit note against a posted sales invoice or a debit note against
/// a posted supplier bill. Notes cannot be raised against notes.
tally::schema::operation_result_t create_note(
    tally::execution::unit_of_work& work,
    const tally::execution::command_context& context,
    const tally::schema::create_note_t& command);

tally::schema::operation_result_t add_document_line(
    tally::execution::unit_of_work& work,
    const tally::execution::command_context& context,
    const tally::schema::add_document_line_t& command);

tally::schema::operation_result_t remove_document_line(
    tally::execution::unit_of_work& work,
    const tally::execution::command_context& context,
    const tally::schema::remove_document_line_t& command);

/// Post a draft document. A note is validated against the remaining balance
/// of its original before anything is staged (exceeds_balance), and once
/// posted it is allocated against the original for its total.
tally::schema::operation_result_t post_document(
    tally::execution::unit_of_work& work,
    const tally::execution::command_context& context,
    const tally::schema::post_document_t& command);

/// Void a posted document by reversing its transaction. A standard document
/// with a paid amount is refused with has_allocations; voiding a note
/// releases its allocation against the original.
tally::schema::operation_result_t void_document(
    tally::execution::unit_of_work& work,
    const tally::execution::command_context& context,
    const tally::schema::void_document_t& command);

}  // namespace tally::posting
