#pragma once

#include <tally/schema/direction.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(tally::schema,
                             direction_t,
                             tally::schema::direction_t::debit,
                             tally::schema::direction_t::credit)
