#pragma once

#include <tally/schema/statement_source.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(tally::schema,
                             statement_source_t,
                             tally::schema::statement_source_t::qif,
                             tally::schema::statement_source_t::ofx,
                             tally::schema::statement_source_t::qfx,
                             tally::schema::statement_source_t::qbo,
                             tally::schema::statement_source_t::csv)
