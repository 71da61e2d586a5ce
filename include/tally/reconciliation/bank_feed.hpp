#pragma once

#include <tally/execution/command_context.hpp>
#include <tally/execution/unit_of_work.hpp>
#include <tally/reconciliation/matcher.hpp>
#include <tally/schema/bank_feed_item.hpp>
#include <tally/schema/ignore_feed_item.hpp>
#include <tally/schema/import_bank_statement.hpp>
#include <tally/schema/match_feed_item.hpp>
#include <tally/schema/operation_result.hpp>
#include <tally/schema/upsert_matching_rule.hpp>
#include <cstddef>
#include <optional>
#include <vector>

// Bank statement imports, feed item matching and the queries over
// unreconciled items.
namespace tally::reconciliation {

/// Store the items of a parsed statement.
///
/// A statement whose file hash was already imported for the bank account
/// under another import id is refused with duplicate_import. Items whose fit
/// id already exists in the import are skipped, so an import can be re-run.
/// The result info reports the inserted and skipped counts.
tally::schema::operation_result_t import_statement(
    tally::execution::unit_of_work& work,
    const tally::execution::command_context& context,
    const tally::schema::import_bank_statement_t& command);

/// Match one new item, either to the transaction named by the command or
/// through the matcher. A rule hit posts a new receipt or payment coded to
/// the rule's target account. Fails with no_match when nothing applies.
tally::schema::operation_result_t match_item(
    tally::execution::unit_of_work& work,
    const tally::execution::command_context& context,
    const tally::schema::match_feed_item_t& command,
    const match_options& options = {});

tally::schema::operation_result_t ignore_item(
    tally::execution::unit_of_work& work,
    const tally::execution::command_context& context,
    const tally::schema::ignore_feed_item_t& command);

tally::schema::operation_result_t upsert_rule(
    tally::execution::unit_of_work& work,
    const tally::execution::command_context& context,
    const tally::schema::upsert_matching_rule_t& command);

/// Posted, non-void, non-reversal transactions that move the bank account
/// within `window_days` of `date` and are not matched to a feed item yet.
std::vector<match_candidate> candidates_for(
    const tally::execution::unit_of_work& work,
    const tally::schema::company_id_t& company_id,
    const tally::schema::account_id_t& bank_account_id,
    tally::schema::date_t date,
    uint32_t window_days);

struct unmatched_summary final {
  std::size_t count{};
  tally::schema::amount_t total{};
  std::optional<tally::schema::date_t> oldest;
};

unmatched_summary summarize_unmatched(
    const tally::execution::unit_of_work& work,
    const tally::schema::company_id_t& company_id,
    const tally::schema::account_id_t& bank_account_id);

/// New items of the bank account, oldest posted date first.
std::vector<tally::schema::bank_feed_item_t> oldest_unmatched(
    const tally::execution::unit_of_work& work,
    const tally::schema::company_id_t& company_id,
    const tally::schema::account_id_t& bank_account_id,
    std::size_t limit);

}  // namespace tally::reconciliation
