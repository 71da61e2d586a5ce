#pragma once

#include <tally/schema/feed_item_status.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(tally::schema,
                             feed_item_status_t,
                             tally::schema::feed_item_status_t::unmatched,
                             tally::schema::feed_item_status_t::matched,
                             tally::schema::feed_item_status_t::ignored)
