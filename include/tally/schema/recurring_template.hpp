#pragma once
#include <tally/schema/frequency.hpp>
#include <tally/schema/primitives.hpp>
#include <tally/schema/transaction_line.hpp>
#include <tally/schema/transaction_type.hpp>
#include <optional>
#include <string>
#include <vector>

namespace tally::schema {

template <uint16_t Version>
struct recurring_template;

template <>
struct recurring_template<1> final {
  uint16_t version{1};
  company_id_t company_id{};
  hash32_t template_id{};
  std::string name;
  transaction_type_t type{transaction_type_t::journal};
  frequency_t frequency{frequency_t::monthly};
  date_t next_run_date{};
  std::optional<date_t> end_date;
  std::optional<uint32_t> remaining_occurrences;
  std::optional<std::string> description;
  std::vector<transaction_line_t> lines;
  bool enabled{true};
  std::optional<transaction_id_t> last_transaction_id;
};

using recurring_template_t = recurring_template<1>;

}  // namespace tally::schema
