#pragma once

#include <tally/schema/posting_status.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(tally::schema,
                             posting_status_t,
                             tally::schema::posting_status_t::draft,
                             tally::schema::posting_status_t::posted,
                             tally::schema::posting_status_t::voided)
