#pragma once

#include <tally/schema/account_class.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(tally::schema,
                             account_class_t,
                             tally::schema::account_class_t::asset,
                             tally::schema::account_class_t::liability,
                             tally::schema::account_class_t::equity,
                             tally::schema::account_class_t::income,
                             tally::schema::account_class_t::expense)
