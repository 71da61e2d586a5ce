#pragma once

#include <tally/schema/transaction_type.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(tally::schema,
                             transaction_type_t,
                             tally::schema::transaction_type_t::payment,
                             tally::schema::transaction_type_t::receipt,
                             tally::schema::transaction_type_t::journal,
                             tally::schema::transaction_type_t::transfer)
