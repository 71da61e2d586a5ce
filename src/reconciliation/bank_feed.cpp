#include <spdlog/spdlog.h>
#include <tally/execution/repository.hpp>
#include <tally/execution/result.hpp>
#include <tally/ledger/ledger.hpp>
#include <tally/posting/posting_engine.hpp>
#include <tally/reconciliation/bank_feed.hpp>
#include <tally/schema/key/keys.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <limits>
#include <map>

using namespace tally::schema;
using tally::execution::kReconciliationCodespace;
using tally::execution::make_error;
using tally::execution::make_success;
using tally::execution::short_id;

namespace tally::reconciliation {

namespace {

/// Signed movement of a transaction on one account, debit positive.
amount_t movement_on(const tally::execution::unit_of_work& work,
                     const transaction_state_t& transaction,
                     const account_id_t& account_id) {
  auto total = amount_t{};
  for (const auto& entry :
       tally::ledger::entries_for_transaction(work, transaction)) {
    if (entry.account_id == account_id) {
      total += entry.amount_dr - entry.amount_cr;
    }
  }
  return total;
}

operation_result_t load_new_item(const tally::execution::unit_of_work& work,
                                 const company_id_t& company_id,
                                 const hash32_t& import_id,
                                 const std::string& fit_id,
                                 std::optional<bank_feed_item_t>& item) {
  item = tally::execution::load_feed_item(work, company_id, import_id, fit_id);
  if (!item) {
    return make_error(error_code::not_found, kReconciliationCodespace,
                      "feed item not found", fit_id);
  }
  if (item->status != feed_item_status_t::unmatched) {
    return make_error(error_code::invalid_state, kReconciliationCodespace,
                      "feed item is not new",
                      std::string{to_string(item->status)});
  }
  return {};
}

void mark_matched(tally::execution::unit_of_work& work,
                  const tally::execution::command_context& context,
                  bank_feed_item_t& item,
                  const transaction_id_t& transaction_id,
                  const std::optional<hash32_t>& rule_id) {
  item.status = feed_item_status_t::matched;
  item.matched_transaction_id = transaction_id;
  item.matched_rule_id = rule_id;
  item.status_changed_at = context.issued_at;
  tally::execution::save_feed_item(work, item);
  work.record(context.make_event(
      audit_action_t::feed_item_matched, transaction_id,
      fmt::format("{} {} matched", item.fit_id,
                  format_amount(item.amount))));
}

operation_result_t code_with_rule(
    tally::execution::unit_of_work& work,
    const tally::execution::command_context& context,
    bank_feed_item_t& item,
    const rule_match& decision) {
  auto transaction = transaction_state_t{};
  transaction.company_id = context.company_id;
  transaction.transaction_id =
      key::make_feed_transaction_id(item.import_id, item.fit_id,
                                    item.rule_codings);
  transaction.type = item.amount > 0 ? transaction_type_t::receipt
                                     : transaction_type_t::payment;
  transaction.date = item.posted_date;
  transaction.reference = item.fit_id;
  transaction.description = item.description;

  auto magnitude = item.amount > 0 ? item.amount : -item.amount;
  auto bank_direction =
      item.amount > 0 ? direction_t::debit : direction_t::credit;
  transaction.lines.push_back(
      transaction_line_t{.account_id = item.bank_account_id,
                         .amount = magnitude,
                         .direction = bank_direction,
                         .memo = decision.memo});
  transaction.lines.push_back(
      transaction_line_t{.account_id = decision.rule.target_account_id,
                         .amount = magnitude,
                         .direction = flip(bank_direction),
                         .tax_code = decision.rule.target_tax_code,
                         .memo = decision.memo});

  if (tally::execution::load_transaction(work, context.company_id,
                                         transaction.transaction_id)) {
    return make_error(error_code::already_exists, kReconciliationCodespace,
                      "feed transaction already exists", item.fit_id);
  }
  auto posted = tally::posting::post(work, context, transaction);
  if (posted.code != 0) {
    return posted;
  }
  ++item.rule_codings;
  mark_matched(work, context, item, transaction.transaction_id,
               decision.rule.rule_id);
  return make_success(kReconciliationCodespace,
                      fmt::format("coded by rule {}", decision.rule.name),
                      transaction.transaction_id);
}

}  // namespace

operation_result_t import_statement(
    tally::execution::unit_of_work& work,
    const tally::execution::command_context& context,
    const import_bank_statement_t& command) {
  auto account = tally::execution::load_account(work, context.company_id,
                                                command.bank_account_id);
  if (!account) {
    return make_error(error_code::not_found, kReconciliationCodespace,
                      "bank account not found",
                      short_id(command.bank_account_id));
  }
  if (!account->is_bank) {
    return make_error(error_code::invalid_command, kReconciliationCodespace,
                      "account is not a bank account", account->code);
  }
  for (const auto& line : command.items) {
    if (line.fit_id.empty()) {
      return make_error(error_code::invalid_command, kReconciliationCodespace,
                        "statement line without fit id");
    }
    if (line.amount == 0 ||
        line.amount == std::numeric_limits<amount_t>::min()) {
      return make_error(error_code::invalid_amount, kReconciliationCodespace,
                        "statement line amount out of range", line.fit_id);
    }
  }

  auto hash_key = key::make_statement_hash_key(
      context.company_id, command.bank_account_id, command.file_hash);
  auto existing_import = work.get<hash32_t>(hash_key);
  if (existing_import && *existing_import != command.import_id) {
    return make_error(error_code::duplicate_import, kReconciliationCodespace,
                      "statement already imported",
                      short_id(*existing_import));
  }

  auto statement = tally::execution::load_statement_import(
      work, context.company_id, command.import_id);
  if (!statement) {
    statement = bank_statement_import_t{};
    statement->company_id = context.company_id;
    statement->import_id = command.import_id;
    statement->bank_account_id = command.bank_account_id;
    statement->source_type = command.source_type;
    statement->source_name = command.source_name;
    statement->file_hash = command.file_hash;
    statement->imported_at = context.issued_at;
  } else if (statement->bank_account_id != command.bank_account_id) {
    return make_error(error_code::invalid_command, kReconciliationCodespace,
                      "import belongs to another bank account");
  }

  auto inserted = uint32_t{};
  auto skipped = uint32_t{};
  for (const auto& line : command.items) {
    if (tally::execution::load_feed_item(work, context.company_id,
                                         command.import_id, line.fit_id)) {
      ++skipped;
      continue;
    }
    auto item = bank_feed_item_t{};
    item.company_id = context.company_id;
    item.import_id = command.import_id;
    item.bank_account_id = command.bank_account_id;
    item.fit_id = line.fit_id;
    item.posted_date = line.posted_date;
    item.amount = line.amount;
    item.description = line.description;
    item.counter_party = line.counter_party;
    tally::execution::save_feed_item(work, item);
    ++inserted;
  }
  statement->item_count += inserted;
  work.put(key::make_statement_import_key(context.company_id,
                                          command.import_id),
           *statement);
  work.put(hash_key, command.import_id);
  work.record(context.make_event(
      audit_action_t::statement_imported, command.import_id,
      fmt::format("{} {} inserted {} skipped {}", to_string(command.source_type),
                  command.source_name, inserted, skipped)));
  return make_success(kReconciliationCodespace,
                      fmt::format("inserted {} skipped {}", inserted, skipped),
                      command.import_id);
}

std::vector<match_candidate> candidates_for(
    const tally::execution::unit_of_work& work,
    const company_id_t& company_id,
    const account_id_t& bank_account_id,
    const date_t date,
    const uint32_t window_days) {
  auto window = static_cast<date_t>(window_days);
  auto by_transaction = std::map<transaction_id_t, match_candidate>{};
  for (const auto& entry :
       tally::ledger::entries_in_range(work, company_id, bank_account_id,
                                       date - window, date + window)) {
    auto [it, inserted] = by_transaction.try_emplace(
        entry.transaction_id,
        match_candidate{.transaction_id = entry.transaction_id,
                        .date = entry.entry_date,
                        .first_sequence = entry.sequence});
    it->second.amount += entry.amount_dr - entry.amount_cr;
    it->second.first_sequence =
        std::min(it->second.first_sequence, entry.sequence);
  }

  auto candidates = std::vector<match_candidate>{};
  for (const auto& [transaction_id, candidate] : by_transaction) {
    auto transaction =
        tally::execution::load_transaction(work, company_id, transaction_id);
    if (!transaction || transaction->status != posting_status_t::posted ||
        transaction->reversal_of) {
      continue;
    }
    if (tally::execution::load_feed_match(work, company_id, transaction_id)) {
      continue;
    }
    candidates.push_back(candidate);
  }
  return candidates;
}

operation_result_t match_item(tally::execution::unit_of_work& work,
                              const tally::execution::command_context& context,
                              const match_feed_item_t& command,
                              const match_options& options) {
  auto item = std::optional<bank_feed_item_t>{};
  if (auto invalid = load_new_item(work, context.company_id, command.import_id,
                                   command.fit_id, item);
      invalid.code != 0) {
    return invalid;
  }

  if (command.transaction_id) {
    auto transaction = tally::execution::load_transaction(
        work, context.company_id, *command.transaction_id);
    if (!transaction) {
      return make_error(error_code::not_found, kReconciliationCodespace,
                        "transaction not found",
                        short_id(*command.transaction_id));
    }
    if (transaction->status != posting_status_t::posted) {
      return make_error(error_code::invalid_state, kReconciliationCodespace,
                        "only posted transactions can be matched",
                        std::string{to_string(transaction->status)});
    }
    if (tally::execution::load_feed_match(work, context.company_id,
                                          transaction->transaction_id)) {
      return make_error(error_code::invalid_state, kReconciliationCodespace,
                        "transaction is already matched");
    }
    auto movement = movement_on(work, *transaction, item->bank_account_id);
    if (movement != item->amount) {
      return make_error(error_code::amount_mismatch, kReconciliationCodespace,
                        "transaction does not move the item amount",
                        fmt::format("item {} transaction {}",
                                    format_amount(item->amount),
                                    format_amount(movement)));
    }
    mark_matched(work, context, *item, transaction->transaction_id,
                 std::nullopt);
    return make_success(kReconciliationCodespace, "matched",
                        transaction->transaction_id);
  }

  auto decision = match(
      *item,
      candidates_for(work, context.company_id, item->bank_account_id,
                     item->posted_date, options.window_days),
      tally::execution::load_matching_rules(work, context.company_id),
      options);
  return std::visit(
      overloaded{
          [&](const existing_transaction_match& found) {
            mark_matched(work, context, *item, found.transaction_id,
                         std::nullopt);
            return make_success(kReconciliationCodespace,
                                "matched existing transaction",
                                found.transaction_id);
          },
          [&](const rule_match& found) {
            return code_with_rule(work, context, *item, found);
          },
          [&](const std::monostate&) {
            return make_error(error_code::no_match, kReconciliationCodespace,
                              "no transaction or rule matched", item->fit_id);
          }},
      decision);
}

operation_result_t ignore_item(tally::execution::unit_of_work& work,
                               const tally::execution::command_context& context,
                               const ignore_feed_item_t& command) {
  auto item = std::optional<bank_feed_item_t>{};
  if (auto invalid = load_new_item(work, context.company_id, command.import_id,
                                   command.fit_id, item);
      invalid.code != 0) {
    return invalid;
  }
  item->status = feed_item_status_t::ignored;
  item->status_changed_at = context.issued_at;
  tally::execution::save_feed_item(work, *item);
  work.record(context.make_event(audit_action_t::feed_item_ignored,
                                 item->import_id, item->fit_id));
  return make_success(kReconciliationCodespace, "ignored", item->import_id);
}

operation_result_t upsert_rule(tally::execution::unit_of_work& work,
                               const tally::execution::command_context& context,
                               const upsert_matching_rule_t& command) {
  if (command.name.empty()) {
    return make_error(error_code::invalid_command, kReconciliationCodespace,
                      "rule name is required");
  }
  if (command.min_amount && command.max_amount &&
      *command.min_amount > *command.max_amount) {
    return make_error(error_code::invalid_command, kReconciliationCodespace,
                      "minimum amount exceeds maximum amount", command.name);
  }
  if (!tally::execution::load_account(work, context.company_id,
                                      command.target_account_id)) {
    return make_error(error_code::not_found, kReconciliationCodespace,
                      "target account not found",
                      short_id(command.target_account_id));
  }
  if (command.target_tax_code &&
      !tally::execution::load_tax_code(work, context.company_id,
                                       *command.target_tax_code)) {
    return make_error(error_code::not_found, kReconciliationCodespace,
                      "tax code not found", *command.target_tax_code);
  }

  auto rule = matching_rule_t{};
  rule.company_id = context.company_id;
  rule.rule_id = command.rule_id;
  rule.name = command.name;
  rule.priority = command.priority;
  rule.match_expression = command.match_expression;
  rule.counter_party_pattern = command.counter_party_pattern;
  rule.min_amount = command.min_amount;
  rule.max_amount = command.max_amount;
  rule.target_account_id = command.target_account_id;
  rule.target_tax_code = command.target_tax_code;
  rule.memo_template = command.memo_template;
  rule.enabled = command.enabled;
  work.put(key::make_matching_rule_key(context.company_id, rule.rule_id), rule);
  return make_success(kReconciliationCodespace, "rule saved", rule.rule_id);
}

unmatched_summary summarize_unmatched(
    const tally::execution::unit_of_work& work,
    const company_id_t& company_id,
    const account_id_t& bank_account_id) {
  auto summary = unmatched_summary{};
  for (const auto& item : tally::execution::load_feed_items(work, company_id)) {
    if (item.bank_account_id != bank_account_id ||
        item.status != feed_item_status_t::unmatched) {
      continue;
    }
    ++summary.count;
    summary.total += item.amount;
    if (!summary.oldest || item.posted_date < *summary.oldest) {
      summary.oldest = item.posted_date;
    }
  }
  return summary;
}

std::vector<bank_feed_item_t> oldest_unmatched(
    const tally::execution::unit_of_work& work,
    const company_id_t& company_id,
    const account_id_t& bank_account_id,
    const std::size_t limit) {
  auto items = tally::execution::load_feed_items(work, company_id);
  std::erase_if(items, [&](const bank_feed_item_t& item) {
    return item.bank_account_id != bank_account_id ||
           item.status != feed_item_status_t::unmatched;
  });
  std::stable_sort(std::begin(items), std::end(items),
                   [](const bank_feed_item_t& lhs, const bank_feed_item_t& rhs) {
                     return lhs.posted_date < rhs.posted_date;
                   });
  if (items.size() > limit) {
    items.resize(limit);
  }
  return items;
}

}  // namespace tally::reconciliation
