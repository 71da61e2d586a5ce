#pragma once

#include <tally/schema/document_kind.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(tally::schema,
                             document_kind_t,
                             tally::schema::document_kind_t::sales_invoice,
                             tally::schema::document_kind_t::supplier_bill,
                             tally::schema::document_kind_t::credit_note,
                             tally::schema::document_kind_t::debit_note)
