#pragma once
#include <tally/schema/primitives.hpp>
#include <tally/schema/statement_source.hpp>
#include <string>

namespace tally::schema {

template <uint16_t Version>
struct bank_statement_import;

template <>
struct bank_statement_import<1> final {
  uint16_t version{1};
  company_id_t company_id{};
  hash32_t import_id{};
  account_id_t bank_account_id{};
  statement_source_t source_type{statement_source_t::ofx};
  std::string source_name;
  // Digest of the statement file; unique per (company, bank account).
  hash32_t file_hash{};
  timestamp_milliseconds_t imported_at{};
  uint32_t item_count{};
};

using bank_statement_import_t = bank_statement_import<1>;

}  // namespace tally::schema
