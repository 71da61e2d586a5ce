#pragma once
#include <tally/schema/primitives.hpp>

namespace tally::schema {

template <uint16_t Version>
struct run_recurring_template;

template <>
struct run_recurring_template<1> final {
  uint16_t version{1};
  hash32_t template_id{};
  // Must equal the template's next run date.
  date_t run_date{};
};

using run_recurring_template_t = run_recurring_template<1>;

}  // namespace tally::schema
