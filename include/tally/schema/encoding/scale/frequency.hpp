#pragma once

#include <tally/schema/frequency.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(tally::schema,
                             frequency_t,
                             tally::schema::frequency_t::weekly,
                             tally::schema::frequency_t::fortnightly,
                             tally::schema::frequency_t::monthly,
                             tally::schema::frequency_t::quarterly,
                             tally::schema::frequency_t::yearly)
