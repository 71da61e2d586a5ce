#pragma once
#include <tally/schema/primitives.hpp>

#include <optional>
#include <string>
#include <string_view>

// Calendar helpers over date_t (days since the Unix epoch).
namespace tally::schema {

date_t make_date(int32_t year, uint32_t month, uint32_t day);

/// Parse a strict ISO "YYYY-MM-DD" date.
std::optional<date_t> try_parse_date(const std::string_view text);

std::string to_iso_string(const date_t date);

/// Add calendar months, clamping to the last day of the target month.
date_t add_months(const date_t date, const int32_t months);

/// Day on which a timestamp falls (UTC).
date_t date_of(const timestamp_milliseconds_t timestamp);

}  // namespace tally::schema
