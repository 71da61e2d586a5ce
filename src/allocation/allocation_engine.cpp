#include <spdlog/spdlog.h>
#include <tally/allocation/allocation_engine.hpp>
#include <tally/common/critical.hpp>
#include <tally/execution/repository.hpp>
#include <tally/execution/result.hpp>
#include <fmt/format.h>

using namespace tally::schema;
using tally::execution::kAllocationCodespace;
using tally::execution::make_error;
using tally::execution::make_success;
using tally::execution::short_id;

namespace tally::allocation {

namespace {

bool compatible(const transaction_type_t type, const document_kind_t kind) {
  switch (type) {
    case transaction_type_t::receipt:
      return kind == document_kind_t::sales_invoice;
    case transaction_type_t::payment:
      return kind == document_kind_t::supplier_bill;
    default:
      return false;
  }
}

operation_result_t version_conflict(const document_state_t& document) {
  return make_error(error_code::version_conflict, kAllocationCodespace,
                    "document was modified concurrently", document.number);
}

}  // namespace

amount_t cash_amount(const transaction_state_t& transaction) {
  return total_debits(transaction);
}

amount_t unallocated_amount(const tally::execution::unit_of_work& work,
                            const transaction_state_t& transaction) {
  auto allocated = amount_t{};
  for (const auto& allocation : tally::execution::load_allocations_for_source(
           work, transaction.company_id, transaction.transaction_id)) {
    allocated += allocation.amount;
  }
  return cash_amount(transaction) - allocated;
}

bool refresh_amount_paid(tally::execution::unit_of_work& work,
                         document_state_t& document) {
  auto paid = tally::execution::allocated_to_document(
      work, document.company_id, document.document_id);
  if (paid < 0 || paid > total(document)) {
    tally::common::critical(
        "allocations against document {} total {} beyond its total {}",
        document.number, format_amount(paid), format_amount(total(document)));
  }
  document.amount_paid = paid;
  return tally::execution::save_document(work, document);
}

operation_result_t allocate(tally::execution::unit_of_work& work,
                            const tally::execution::command_context& context,
                            const allocate_t& command) {
  if (command.amount <= 0) {
    return make_error(error_code::invalid_amount, kAllocationCodespace,
                      "allocation amount must be positive",
                      fmt::format("amount {}", command.amount));
  }
  auto transaction = tally::execution::load_transaction(
      work, context.company_id, command.source_transaction_id);
  if (!transaction) {
    return make_error(error_code::not_found, kAllocationCodespace,
                      "source transaction not found",
                      short_id(command.source_transaction_id));
  }
  auto document = tally::execution::load_document(work, context.company_id,
                                                  command.document_id);
  if (!document) {
    return make_error(error_code::not_found, kAllocationCodespace,
                      "document not found", short_id(command.document_id));
  }
  if (transaction->status != posting_status_t::posted ||
      document->status != posting_status_t::posted) {
    return make_error(error_code::invalid_state, kAllocationCodespace,
                      "transaction and document must both be posted");
  }
  if (transaction->reversal_of || transaction->source_document_id) {
    return make_error(error_code::invalid_state, kAllocationCodespace,
                      "only cash transactions can be allocated");
  }
  if (is_note(document->kind) ||
      !compatible(transaction->type, document->kind)) {
    return make_error(error_code::type_mismatch, kAllocationCodespace,
                      "transaction type cannot pay this document",
                      fmt::format("{} to {}", to_string(transaction->type),
                                  to_string(document->kind)));
  }
  if (tally::execution::load_allocation(work, context.company_id,
                                        transaction->transaction_id,
                                        document->document_id)) {
    return make_error(error_code::already_allocated, kAllocationCodespace,
                      "transaction is already allocated to this document",
                      document->number);
  }

  auto outstanding =
      total(*document) - tally::execution::allocated_to_document(
                             work, context.company_id, document->document_id);
  if (command.amount > outstanding) {
    return make_error(error_code::over_allocation, kAllocationCodespace,
                      "amount exceeds the document balance",
                      fmt::format("amount {} balance {}",
                                  format_amount(command.amount),
                                  format_amount(outstanding)));
  }
  auto available = unallocated_amount(work, *transaction);
  if (command.amount > available) {
    return make_error(error_code::over_allocation, kAllocationCodespace,
                      "amount exceeds the unallocated cash",
                      fmt::format("amount {} unallocated {}",
                                  format_amount(command.amount),
                                  format_amount(available)));
  }

  tally::execution::save_allocation(
      work, allocation_t{.company_id = context.company_id,
                         .source_transaction_id = transaction->transaction_id,
                         .document_id = document->document_id,
                         .amount = command.amount,
                         .effective_date = transaction->date,
                         .allocated_at = context.issued_at,
                         .allocated_by = context.actor});
  if (!refresh_amount_paid(work, *document)) {
    return version_conflict(*document);
  }
  work.record(context.make_event(
      audit_action_t::allocation_created, document->document_id,
      fmt::format("allocated {} from {} to {}", format_amount(command.amount),
                  short_id(transaction->transaction_id), document->number)));
  spdlog::debug("Staged allocation of {} to {}", format_amount(command.amount),
                document->number);
  return make_success(kAllocationCodespace,
                      fmt::format("balance {}", format_amount(
                                                    balance(*document))),
                      document->document_id);
}

operation_result_t unallocate(tally::execution::unit_of_work& work,
                              const tally::execution::command_context& context,
                              const unallocate_t& command) {
  auto allocation = tally::execution::load_allocation(
      work, context.company_id, command.source_transaction_id,
      command.document_id);
  if (!allocation) {
    return make_error(error_code::not_found, kAllocationCodespace,
                      "allocation not found");
  }
  auto transaction = tally::execution::load_transaction(
      work, context.company_id, command.source_transaction_id);
  if (transaction && transaction->source_document_id) {
    return make_error(error_code::invalid_state, kAllocationCodespace,
                      "note allocations are removed by voiding the note");
  }
  auto document = tally::execution::load_document(work, context.company_id,
                                                  command.document_id);
  if (!document) {
    tally::common::critical("allocation references a missing document");
  }

  tally::execution::erase_allocation(work, *allocation);
  if (!refresh_amount_paid(work, *document)) {
    return version_conflict(*document);
  }
  work.record(context.make_event(
      audit_action_t::allocation_removed, document->document_id,
      fmt::format("removed {} from {}", format_amount(allocation->amount),
                  document->number)));
  return make_success(kAllocationCodespace, "allocation removed",
                      document->document_id);
}

operation_result_t release_source_allocations(
    tally::execution::unit_of_work& work,
    const tally::execution::command_context& context,
    const transaction_state_t& transaction) {
  auto allocations = tally::execution::load_allocations_for_source(
      work, transaction.company_id, transaction.transaction_id);
  for (const auto& allocation : allocations) {
    tally::execution::erase_allocation(work, allocation);
  }
  for (const auto& allocation : allocations) {
    auto document = tally::execution::load_document(
        work, transaction.company_id, allocation.document_id);
    if (!document) {
      tally::common::critical("allocation references a missing document");
    }
    if (!refresh_amount_paid(work, *document)) {
      return version_conflict(*document);
    }
    work.record(context.make_event(
        audit_action_t::allocation_removed, document->document_id,
        fmt::format("released {} from {}", format_amount(allocation.amount),
                    document->number)));
  }
  return make_success(kAllocationCodespace,
                      fmt::format("released {} allocation(s)",
                                  allocations.size()));
}

operation_result_t apply_note(tally::execution::unit_of_work& work,
                              const tally::execution::command_context& context,
                              const document_state_t& note) {
  if (!note.original_document_id || !note.posted_transaction_id) {
    return make_error(error_code::invalid_state, kAllocationCodespace,
                      "note is not posted against a document", note.number);
  }
  auto original = tally::execution::load_document(work, note.company_id,
                                                  *note.original_document_id);
  if (!original) {
    return make_error(error_code::not_found, kAllocationCodespace,
                      "original document not found");
  }
  auto amount = total(note);
  if (amount > balance(*original)) {
    return make_error(error_code::exceeds_balance, kAllocationCodespace,
                      "note exceeds the remaining balance",
                      original->number);
  }

  tally::execution::save_allocation(
      work, allocation_t{.company_id = note.company_id,
                         .source_transaction_id = *note.posted_transaction_id,
                         .document_id = original->document_id,
                         .amount = amount,
                         .effective_date = note.issue_date,
                         .allocated_at = context.issued_at,
                         .allocated_by = context.actor});
  if (!refresh_amount_paid(work, *original)) {
    return version_conflict(*original);
  }
  work.record(context.make_event(
      audit_action_t::allocation_created, original->document_id,
      fmt::format("{} {} applied {}", to_string(note.kind), note.number,
                  format_amount(amount))));
  return make_success(kAllocationCodespace, "note applied",
                      original->document_id);
}

operation_result_t release_note(tally::execution::unit_of_work& work,
                                const tally::execution::command_context& context,
                                const document_state_t& note) {
  if (!note.original_document_id || !note.posted_transaction_id) {
    return make_error(error_code::invalid_state, kAllocationCodespace,
                      "note is not posted against a document", note.number);
  }
  auto allocation = tally::execution::load_allocation(
      work, note.company_id, *note.posted_transaction_id,
      *note.original_document_id);
  if (!allocation) {
    return make_success(kAllocationCodespace, "nothing to release");
  }
  auto original = tally::execution::load_document(work, note.company_id,
                                                  *note.original_document_id);
  if (!original) {
    tally::common::critical("note allocation references a missing document");
  }
  tally::execution::erase_allocation(work, *allocation);
  if (!refresh_amount_paid(work, *original)) {
    return version_conflict(*original);
  }
  work.record(context.make_event(
      audit_action_t::allocation_removed, original->document_id,
      fmt::format("{} {} released", to_string(note.kind), note.number)));
  return make_success(kAllocationCodespace, "note released",
                      original->document_id);
}

}  // namespace tally::allocation
