#include <spdlog/spdlog.h>
#include <tally/allocation/allocation_engine.hpp>
#include <tally/execution/repository.hpp>
#include <tally/execution/result.hpp>
#include <tally/ledger/ledger.hpp>
#include <tally/posting/posting_engine.hpp>
#include <tally/schema/key/keys.hpp>
#include <fmt/format.h>

using namespace tally::schema;
using tally::execution::kPostingCodespace;
using tally::execution::make_error;
using tally::execution::make_success;
using tally::execution::short_id;

namespace tally::posting {

namespace {

operation_result_t validate_line_amount(const transaction_line_t& line) {
  if (line.amount <= 0) {
    return make_error(error_code::invalid_amount, kPostingCodespace,
                      "line amount must be positive",
                      fmt::format("amount {}", line.amount));
  }
  return {};
}

}  // namespace

operation_result_t post(tally::execution::unit_of_work& work,
                        const tally::execution::command_context& context,
                        transaction_state_t& transaction,
                        const post_options options) {
  if (transaction.status != posting_status_t::draft) {
    return make_error(error_code::invalid_state, kPostingCodespace,
                      "transaction is not a draft",
                      std::string{to_string(transaction.status)});
  }
  if (transaction.lines.empty()) {
    return make_error(error_code::empty_transaction, kPostingCodespace,
                      "transaction has no lines");
  }
  for (const auto& line : transaction.lines) {
    if (auto invalid = validate_line_amount(line); invalid.code != 0) {
      return invalid;
    }
    auto account = tally::execution::load_account(
        work, transaction.company_id, line.account_id);
    if (!account) {
      return make_error(error_code::not_found, kPostingCodespace,
                        "line account not found", short_id(line.account_id));
    }
    if (!account->active && !options.allow_inactive_accounts) {
      return make_error(error_code::inactive_account, kPostingCodespace,
                        "line account is inactive", account->code);
    }
  }
  auto debits = total_debits(transaction);
  auto credits = total_credits(transaction);
  if (debits != credits) {
    return make_error(error_code::unbalanced_transaction, kPostingCodespace,
                      "debits do not equal credits",
                      fmt::format("debits {} credits {}", format_amount(debits),
                                  format_amount(credits)));
  }

  transaction.entry_sequences = tally::ledger::append_entries(work, transaction);
  transaction.status = posting_status_t::posted;
  transaction.posted_at = context.issued_at;
  tally::execution::save_transaction(work, transaction);
  work.record(context.make_event(
      audit_action_t::transaction_posted, transaction.transaction_id,
      fmt::format("posted {} {} with {} entries", to_string(transaction.type),
                  format_amount(debits), transaction.entry_sequences.size())));

  spdlog::debug("Staged posting of transaction {} ({} lines)",
                short_id(transaction.transaction_id), transaction.lines.size());
  return make_success(kPostingCodespace, "transaction posted",
                      transaction.transaction_id);
}

operation_result_t reverse(tally::execution::unit_of_work& work,
                           const tally::execution::command_context& context,
                           transaction_state_t& original,
                           const std::string& reason,
                           const std::optional<date_t> reversal_date) {
  if (original.status != posting_status_t::posted) {
    return make_error(error_code::invalid_state, kPostingCodespace,
                      "only posted transactions can be reversed",
                      std::string{to_string(original.status)});
  }
  auto date = reversal_date.value_or(original.date);
  if (date < original.date) {
    return make_error(error_code::invalid_command, kPostingCodespace,
                      "reversal date precedes the original date");
  }
  auto reversal_id = key::make_reversal_id(original.transaction_id);
  if (tally::execution::load_transaction(work, original.company_id,
                                         reversal_id)) {
    return make_error(error_code::already_exists, kPostingCodespace,
                      "reversal already exists", short_id(reversal_id));
  }

  auto reversal = transaction_state_t{};
  reversal.company_id = original.company_id;
  reversal.transaction_id = reversal_id;
  reversal.type = original.type;
  reversal.date = date;
  reversal.reference = original.reference;
  reversal.description = fmt::format("Reversal: {}", reason);
  reversal.reversal_of = original.transaction_id;
  reversal.source_document_id = original.source_document_id;
  reversal.lines.reserve(original.lines.size());
  for (const auto& line : original.lines) {
    auto flipped = line;
    flipped.direction = flip(line.direction);
    reversal.lines.push_back(std::move(flipped));
  }

  auto posted = post(work, context, reversal,
                     post_options{.allow_inactive_accounts = true});
  if (posted.code != 0) {
    return posted;
  }

  original.status = posting_status_t::voided;
  original.reversed_by = reversal_id;
  original.void_reason = reason;
  tally::execution::save_transaction(work, original);
  work.record(context.make_event(audit_action_t::transaction_voided,
                                 original.transaction_id, reason));
  return make_success(kPostingCodespace, "transaction voided", reversal_id);
}

operation_result_t create_transaction(
    tally::execution::unit_of_work& work,
    const tally::execution::command_context& context,
    const create_transaction_t& command) {
  if (tally::execution::load_transaction(work, context.company_id,
                                         command.transaction_id)) {
    return make_error(error_code::already_exists, kPostingCodespace,
                      "transaction already exists",
                      short_id(command.transaction_id));
  }
  for (const auto& line : command.lines) {
    if (auto invalid = validate_line_amount(line); invalid.code != 0) {
      return invalid;
    }
  }

  auto transaction = transaction_state_t{};
  transaction.company_id = context.company_id;
  transaction.transaction_id = command.transaction_id;
  transaction.type = command.type;
  transaction.date = command.date;
  transaction.reference = command.reference;
  transaction.description = command.description;
  transaction.lines = command.lines;
  tally::execution::save_transaction(work, transaction);
  return make_success(kPostingCodespace, "transaction created",
                      transaction.transaction_id);
}

operation_result_t add_transaction_line(
    tally::execution::unit_of_work& work,
    const tally::execution::command_context& context,
    const add_transaction_line_t& command) {
  auto transaction = tally::execution::load_transaction(
      work, context.company_id, command.transaction_id);
  if (!transaction) {
    return make_error(error_code::not_found, kPostingCodespace,
                      "transaction not found");
  }
  if (transaction->status != posting_status_t::draft) {
    return make_error(error_code::invalid_state, kPostingCodespace,
                      "only draft transactions can be edited");
  }
  if (auto invalid = validate_line_amount(command.line); invalid.code != 0) {
    return invalid;
  }
  transaction->lines.push_back(command.line);
  tally::execution::save_transaction(work, *transaction);
  return make_success(kPostingCodespace, "line added",
                      transaction->transaction_id);
}

operation_result_t remove_transaction_line(
    tally::execution::unit_of_work& work,
    const tally::execution::command_context& context,
    const remove_transaction_line_t& command) {
  auto transaction = tally::execution::load_transaction(
      work, context.company_id, command.transaction_id);
  if (!transaction) {
    return make_error(error_code::not_found, kPostingCodespace,
                      "transaction not found");
  }
  if (transaction->status != posting_status_t::draft) {
    return make_error(error_code::invalid_state, kPostingCodespace,
                      "only draft transactions can be edited");
  }
  if (command.line_index >= transaction->lines.size()) {
    return make_error(error_code::invalid_command, kPostingCodespace,
                      "line index out of range",
                      std::to_string(command.line_index));
  }
  transaction->lines.erase(std::begin(transaction->lines) +
                           command.line_index);
  tally::execution::save_transaction(work, *transaction);
  return make_success(kPostingCodespace, "line removed",
                      transaction->transaction_id);
}

operation_result_t post_transaction(
    tally::execution::unit_of_work& work,
    const tally::execution::command_context& context,
    const post_transaction_t& command) {
  auto transaction = tally::execution::load_transaction(
      work, context.company_id, command.transaction_id);
  if (!transaction) {
    return make_error(error_code::not_found, kPostingCodespace,
                      "transaction not found");
  }
  return post(work, context, *transaction);
}

operation_result_t void_transaction(
    tally::execution::unit_of_work& work,
    const tally::execution::command_context& context,
    const void_transaction_t& command) {
  auto transaction = tally::execution::load_transaction(
      work, context.company_id, command.transaction_id);
  if (!transaction) {
    return make_error(error_code::not_found, kPostingCodespace,
                      "transaction not found");
  }
  if (transaction->status != posting_status_t::posted) {
    return make_error(error_code::invalid_state, kPostingCodespace,
                      "only posted transactions can be voided",
                      std::string{to_string(transaction->status)});
  }
  if (transaction->reversal_of) {
    return make_error(error_code::invalid_state, kPostingCodespace,
                      "reversal transactions cannot be voided");
  }
  if (transaction->source_document_id) {
    return make_error(error_code::invalid_state, kPostingCodespace,
                      "transaction belongs to a document; void the document");
  }

  auto allocations = tally::execution::load_allocations_for_source(
      work, context.company_id, transaction->transaction_id);
  if (!allocations.empty()) {
    if (!command.release_allocations) {
      return make_error(error_code::has_allocations, kPostingCodespace,
                        "transaction has allocations",
                        fmt::format("{} allocation(s)", allocations.size()));
    }
    auto released = tally::allocation::release_source_allocations(
        work, context, *transaction);
    if (released.code != 0) {
      return released;
    }
  }

  if (auto matched = tally::execution::load_feed_match(
          work, context.company_id, transaction->transaction_id)) {
    auto item = tally::execution::load_feed_item(
        work, context.company_id, std::get<0>(*matched), std::get<1>(*matched));
    if (item) {
      item->status = feed_item_status_t::unmatched;
      item->matched_transaction_id.reset();
      item->matched_rule_id.reset();
      item->status_changed_at = context.issued_at;
      tally::execution::save_feed_item(work, *item);
    }
    tally::execution::erase_feed_match(work, context.company_id,
                                       transaction->transaction_id);
  }

  return reverse(work, context, *transaction, command.reason,
                 command.reversal_date);
}

}  // namespace tally::posting
