#include <spdlog/spdlog.h>
#include <tally/allocation/allocation_engine.hpp>
#include <tally/common/critical.hpp>
#include <tally/execution/repository.hpp>
#include <tally/execution/result.hpp>
#include <tally/posting/document_posting.hpp>
#include <tally/posting/posting_engine.hpp>
#include <tally/schema/key/keys.hpp>
#include <fmt/format.h>

using namespace tally::schema;
using tally::execution::kDocumentCodespace;
using tally::execution::make_error;
using tally::execution::make_success;
using tally::execution::short_id;

namespace tally::posting {

namespace {

/// Check amounts and accounts of a line and annotate it with the rate of its
/// tax code.
operation_result_t prepare_line(const tally::execution::unit_of_work& work,
                                const company_id_t& company_id,
                                document_line_t& line) {
  if (line.net_amount <= 0 || line.tax_amount < 0) {
    return make_error(error_code::invalid_amount, kDocumentCodespace,
                      "line amounts must be positive",
                      fmt::format("net {} tax {}", line.net_amount,
                                  line.tax_amount));
  }
  if (!tally::execution::load_account(work, company_id, line.account_id)) {
    return make_error(error_code::not_found, kDocumentCodespace,
                      "line account not found", short_id(line.account_id));
  }
  if (line.tax_code) {
    auto tax_code =
        tally::execution::load_tax_code(work, company_id, *line.tax_code);
    if (!tax_code) {
      return make_error(error_code::not_found, kDocumentCodespace,
                        "tax code not found", *line.tax_code);
    }
    line.tax_rate_basis_points = tax_code->rate_basis_points;
  }
  return {};
}

std::string next_note_number(const tally::execution::unit_of_work& work,
                             const document_state_t& original) {
  auto prefix = note_kind_for(original.kind) == document_kind_t::credit_note
                    ? std::string_view{"CN-"}
                    : std::string_view{"DN-"};
  auto base = fmt::format("{}{}", prefix, original.number);
  auto candidate = base;
  for (auto suffix = 1; tally::execution::find_document_by_number(
           work, original.company_id, candidate);
       ++suffix) {
    candidate = fmt::format("{}-{}", base, suffix);
  }
  return candidate;
}

operation_result_t version_conflict(const document_state_t& document) {
  return make_error(error_code::version_conflict, kDocumentCodespace,
                    "document was modified concurrently", document.number);
}

}  // namespace

std::vector<transaction_line_t> document_lines(
    const document_state_t& document,
    const account_id_t& control_account_id,
    const std::optional<account_id_t>& tax_account_id) {
  auto control_direction = base_kind(document.kind) ==
                                   document_kind_t::sales_invoice
                               ? direction_t::debit
                               : direction_t::credit;
  if (is_note(document.kind)) {
    control_direction = flip(control_direction);
  }
  auto line_direction = flip(control_direction);

  auto lines = std::vector<transaction_line_t>{};
  lines.reserve(document.lines.size() + 2);
  lines.push_back(transaction_line_t{.account_id = control_account_id,
                                     .amount = total(document),
                                     .direction = control_direction,
                                     .memo = document.number});
  for (const auto& line : document.lines) {
    lines.push_back(transaction_line_t{.account_id = line.account_id,
                                       .amount = line.net_amount,
                                       .direction = line_direction,
                                       .tax_code = line.tax_code,
                                       .department = line.department,
                                       .memo = line.description});
  }
  auto tax = tax_total(document);
  if (tax > 0 && tax_account_id) {
    lines.push_back(transaction_line_t{.account_id = *tax_account_id,
                                       .amount = tax,
                                       .direction = line_direction,
                                       .memo = document.number});
  }
  return lines;
}

operation_result_t create_document(
    tally::execution::unit_of_work& work,
    const tally::execution::command_context& context,
    const create_document_t& command) {
  if (is_note(command.kind)) {
    return make_error(error_code::invalid_command, kDocumentCodespace,
                      "notes are raised against an existing document");
  }
  if (command.number.empty()) {
    return make_error(error_code::invalid_command, kDocumentCodespace,
                      "document number is required");
  }
  if (command.due_date < command.issue_date) {
    return make_error(error_code::invalid_command, kDocumentCodespace,
                      "due date precedes issue date");
  }
  if (tally::execution::load_document(work, context.company_id,
                                      command.document_id)) {
    return make_error(error_code::already_exists, kDocumentCodespace,
                      "document already exists", short_id(command.document_id));
  }
  if (tally::execution::find_document_by_number(work, context.company_id,
                                                command.number)) {
    return make_error(error_code::already_exists, kDocumentCodespace,
                      "document number already used", command.number);
  }

  auto document = document_state_t{};
  document.company_id = context.company_id;
  document.document_id = command.document_id;
  document.kind = command.kind;
  document.number = command.number;
  document.contact = command.contact;
  document.issue_date = command.issue_date;
  document.due_date = command.due_date;
  document.lines = command.lines;
  for (auto& line : document.lines) {
    if (auto invalid = prepare_line(work, context.company_id, line);
        invalid.code != 0) {
      return invalid;
    }
  }
  if (!tally::execution::save_document(work, document)) {
    return version_conflict(document);
  }
  return make_success(kDocumentCodespace, "document created",
                      document.document_id);
}

operation_result_t create_note(tally::execution::unit_of_work& work,
                               const tally::execution::command_context& context,
                               const create_note_t& command) {
  if (tally::execution::load_document(work, context.company_id,
                                      command.note_id)) {
    return make_error(error_code::already_exists, kDocumentCodespace,
                      "document already exists", short_id(command.note_id));
  }
  auto original = tally::execution::load_document(
      work, context.company_id, command.original_document_id);
  if (!original) {
    return make_error(error_code::not_found, kDocumentCodespace,
                      "original document not found");
  }
  if (is_note(original->kind)) {
    return make_error(error_code::invalid_state, kDocumentCodespace,
                      "cannot raise a note against another note",
                      original->number);
  }
  if (original->status != posting_status_t::posted) {
    return make_error(error_code::invalid_state, kDocumentCodespace,
                      "notes can only be raised against posted documents",
                      original->number);
  }

  auto note = document_state_t{};
  note.company_id = context.company_id;
  note.document_id = command.note_id;
  note.kind = note_kind_for(original->kind);
  note.contact = original->contact;
  note.issue_date = command.issue_date;
  note.due_date = command.issue_date;
  note.original_document_id = original->document_id;
  if (command.number) {
    if (tally::execution::find_document_by_number(work, context.company_id,
                                                  *command.number)) {
      return make_error(error_code::already_exists, kDocumentCodespace,
                        "document number already used", *command.number);
    }
    note.number = *command.number;
  } else {
    note.number = next_note_number(work, *original);
  }
  if (command.copy_lines) {
    note.lines = original->lines;
  }
  if (!tally::execution::save_document(work, note)) {
    return version_conflict(note);
  }
  return make_success(kDocumentCodespace,
                      fmt::format("{} {} created", to_string(note.kind),
                                  note.number),
                      note.document_id);
}

operation_result_t add_document_line(
    tally::execution::unit_of_work& work,
    const tally::execution::command_context& context,
    const add_document_line_t& command) {
  auto document = tally::execution::load_document(work, context.company_id,
                                                  command.document_id);
  if (!document) {
    return make_error(error_code::not_found, kDocumentCodespace,
                      "document not found");
  }
  if (document->status != posting_status_t::draft) {
    return make_error(error_code::invalid_state, kDocumentCodespace,
                      "only draft documents can be edited", document->number);
  }
  auto line = command.line;
  if (auto invalid = prepare_line(work, context.company_id, line);
      invalid.code != 0) {
    return invalid;
  }
  document->lines.push_back(std::move(line));
  if (!tally::execution::save_document(work, *document)) {
    return version_conflict(*document);
  }
  return make_success(kDocumentCodespace, "line added", document->document_id);
}

operation_result_t remove_document_line(
    tally::execution::unit_of_work& work,
    const tally::execution::command_context& context,
    const remove_document_line_t& command) {
  auto document = tally::execution::load_document(work, context.company_id,
                                                  command.document_id);
  if (!document) {
    return make_error(error_code::not_found, kDocumentCodespace,
                      "document not found");
  }
  if (document->status != posting_status_t::draft) {
    return make_error(error_code::invalid_state, kDocumentCodespace,
                      "only draft documents can be edited", document->number);
  }
  if (command.line_index >= document->lines.size()) {
    return make_error(error_code::invalid_command, kDocumentCodespace,
                      "line index out of range",
                      std::to_string(command.line_index));
  }
  document->lines.erase(std::begin(document->lines) + command.line_index);
  if (!tally::execution::save_document(work, *document)) {
    return version_conflict(*document);
  }
  return make_success(kDocumentCodespace, "line removed",
                      document->document_id);
}

operation_result_t post_document(
    tally::execution::unit_of_work& work,
    const tally::execution::command_context& context,
    const post_document_t& command) {
  auto document = tally::execution::load_document(work, context.company_id,
                                                  command.document_id);
  if (!document) {
    return make_error(error_code::not_found, kDocumentCodespace,
                      "document not found");
  }
  if (document->status != posting_status_t::draft) {
    return make_error(error_code::invalid_state, kDocumentCodespace,
                      "document is not a draft", document->number);
  }
  if (document->lines.empty()) {
    return make_error(error_code::empty_transaction, kDocumentCodespace,
                      "document has no lines", document->number);
  }

  if (is_note(document->kind)) {
    auto original = tally::execution::load_document(
        work, context.company_id, *document->original_document_id);
    if (!original) {
      return make_error(error_code::not_found, kDocumentCodespace,
                        "original document not found");
    }
    if (original->status != posting_status_t::posted) {
      return make_error(error_code::invalid_state, kDocumentCodespace,
                        "original document is not posted", original->number);
    }
    auto remaining =
        total(*original) - tally::execution::allocated_to_document(
                               work, context.company_id, original->document_id);
    if (total(*document) > remaining) {
      return make_error(
          error_code::exceeds_balance, kDocumentCodespace,
          "note exceeds the remaining balance of the original document",
          fmt::format("note {} remaining {}", format_amount(total(*document)),
                      format_amount(remaining)));
    }
  }

  auto settings =
      tally::execution::load_company_settings(work, context.company_id);
  auto receivable = base_kind(document->kind) == document_kind_t::sales_invoice;
  const auto& control_code =
      receivable ? settings.receivables_code : settings.payables_code;
  const auto& tax_code =
      receivable ? settings.tax_collected_code : settings.tax_paid_code;
  auto control = tally::execution::load_account_by_code(
      work, context.company_id, control_code);
  if (!control) {
    return make_error(error_code::not_found, kDocumentCodespace,
                      "control account not configured", control_code);
  }
  auto tax_account_id = std::optional<account_id_t>{};
  if (tax_total(*document) > 0) {
    auto tax_account = tally::execution::load_account_by_code(
        work, context.company_id, tax_code);
    if (!tax_account) {
      return make_error(error_code::not_found, kDocumentCodespace,
                        "tax account not configured", tax_code);
    }
    tax_account_id = tax_account->account_id;
  }

  auto transaction = transaction_state_t{};
  transaction.company_id = context.company_id;
  transaction.transaction_id =
      key::make_document_transaction_id(document->document_id);
  transaction.type = transaction_type_t::journal;
  transaction.date = document->issue_date;
  transaction.reference = document->number;
  transaction.description =
      fmt::format("{} {}", to_string(document->kind), document->contact);
  transaction.source_document_id = document->document_id;
  transaction.lines =
      document_lines(*document, control->account_id, tax_account_id);
  if (tally::execution::load_transaction(work, context.company_id,
                                         transaction.transaction_id)) {
    return make_error(error_code::already_exists, kDocumentCodespace,
                      "document transaction already exists", document->number);
  }

  auto posted = post(work, context, transaction);
  if (posted.code != 0) {
    return posted;
  }

  document->status = posting_status_t::posted;
  document->posted_transaction_id = transaction.transaction_id;
  if (!tally::execution::save_document(work, *document)) {
    return version_conflict(*document);
  }
  if (is_note(document->kind)) {
    auto applied = tally::allocation::apply_note(work, context, *document);
    if (applied.code != 0) {
      return applied;
    }
  }
  work.record(context.make_event(
      audit_action_t::document_posted, document->document_id,
      fmt::format("posted {} {} for {}", to_string(document->kind),
                  document->number, format_amount(total(*document)))));
  return make_success(kDocumentCodespace, "document posted",
                      transaction.transaction_id);
}

operation_result_t void_document(
    tally::execution::unit_of_work& work,
    const tally::execution::command_context& context,
    const void_document_t& command) {
  auto document = tally::execution::load_document(work, context.company_id,
                                                  command.document_id);
  if (!document) {
    return make_error(error_code::not_found, kDocumentCodespace,
                      "document not found");
  }
  if (document->status != posting_status_t::posted) {
    return make_error(error_code::invalid_state, kDocumentCodespace,
                      "only posted documents can be voided", document->number);
  }
  if (!is_note(document->kind) &&
      tally::execution::allocated_to_document(work, context.company_id,
                                              document->document_id) > 0) {
    return make_error(error_code::has_allocations, kDocumentCodespace,
                      "document has allocations", document->number);
  }
  auto transaction = tally::execution::load_transaction(
      work, context.company_id, *document->posted_transaction_id);
  if (!transaction) {
    tally::common::critical("posted document without its transaction");
  }

  if (is_note(document->kind)) {
    auto released = tally::allocation::release_note(work, context, *document);
    if (released.code != 0) {
      return released;
    }
  }
  auto reversed = reverse(work, context, *transaction, command.reason,
                          command.reversal_date);
  if (reversed.code != 0) {
    return reversed;
  }

  document->status = posting_status_t::voided;
  if (!tally::execution::save_document(work, *document)) {
    return version_conflict(*document);
  }
  work.record(context.make_event(audit_action_t::document_voided,
                                 document->document_id, command.reason));
  return make_success(kDocumentCodespace, "document voided",
                      reversed.subject_id);
}

}  // namespace tally::posting
