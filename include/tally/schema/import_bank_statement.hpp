#pragma once
#include <tally/schema/bank_feed_line.hpp>
#include <tally/schema/primitives.hpp>
#include <tally/schema/statement_source.hpp>
#include <string>
#include <vector>

namespace tally::schema {

template <uint16_t Version>
struct import_bank_statement;

template <>
struct import_bank_statement<1> final {
  uint16_t version{1};
  hash32_t import_id{};
  account_id_t bank_account_id{};
  statement_source_t source_type{statement_source_t::ofx};
  std::string source_name;
  hash32_t file_hash{};
  std::vector<bank_feed_line_t> items;
};

using import_bank_statement_t = import_bank_statement<1>;

}  // namespace tally::schema
