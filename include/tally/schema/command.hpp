#pragma once
#include <tally/schema/add_document_line.hpp>
#include <tally/schema/add_transaction_line.hpp>
#include <tally/schema/allocate.hpp>
#include <tally/schema/configure_company.hpp>
#include <tally/schema/create_document.hpp>
#include <tally/schema/create_note.hpp>
#include <tally/schema/create_transaction.hpp>
#include <tally/schema/ignore_feed_item.hpp>
#include <tally/schema/import_bank_statement.hpp>
#include <tally/schema/match_feed_item.hpp>
#include <tally/schema/post_document.hpp>
#include <tally/schema/post_transaction.hpp>
#include <tally/schema/primitives.hpp>
#include <tally/schema/remove_document_line.hpp>
#include <tally/schema/remove_transaction_line.hpp>
#include <tally/schema/run_recurring_template.hpp>
#include <tally/schema/unallocate.hpp>
#include <tally/schema/upsert_account.hpp>
#include <tally/schema/upsert_matching_rule.hpp>
#include <tally/schema/upsert_recurring_template.hpp>
#include <tally/schema/upsert_tax_code.hpp>
#include <tally/schema/void_document.hpp>
#include <tally/schema/void_transaction.hpp>
#include <variant>

namespace tally::schema {

using command_payload_t = std::variant<configure_company_t,
                                       upsert_account_t,
                                       upsert_tax_code_t,
                                       create_transaction_t,
                                       add_transaction_line_t,
                                       remove_transaction_line_t,
                                       post_transaction_t,
                                       void_transaction_t,
                                       create_document_t,
                                       create_note_t,
                                       add_document_line_t,
                                       remove_document_line_t,
                                       post_document_t,
                                       void_document_t,
                                       allocate_t,
                                       unallocate_t,
                                       import_bank_statement_t,
                                       match_feed_item_t,
                                       ignore_feed_item_t,
                                       upsert_matching_rule_t,
                                       upsert_recurring_template_t,
                                       run_recurring_template_t>;

template <uint16_t Version>
struct command;

// Application command envelope. Every command runs as one unit of work
// scoped to a single company.
template <>
struct command<1> final {
  uint16_t version{1};
  company_id_t company_id{};
  actor_id_t actor{};
  timestamp_milliseconds_t issued_at{};
  command_payload_t payload{};
};

using command_t = command<1>;

}  // namespace tally::schema
