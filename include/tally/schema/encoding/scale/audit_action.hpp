#pragma once

#include <tally/schema/audit_action.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(tally::schema,
                             audit_action_t,
                             tally::schema::audit_action_t::transaction_posted,
                             tally::schema::audit_action_t::transaction_voided,
                             tally::schema::audit_action_t::document_posted,
                             tally::schema::audit_action_t::document_voided,
                             tally::schema::audit_action_t::allocation_created,
                             tally::schema::audit_action_t::allocation_removed,
                             tally::schema::audit_action_t::statement_imported,
                             tally::schema::audit_action_t::feed_item_matched,
                             tally::schema::audit_action_t::feed_item_ignored,
                             tally::schema::audit_action_t::recurring_executed)
