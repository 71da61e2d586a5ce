#pragma once
#include <tally/schema/document_kind.hpp>
#include <tally/schema/document_line.hpp>
#include <tally/schema/primitives.hpp>
#include <string>
#include <vector>

namespace tally::schema {

template <uint16_t Version>
struct create_document;

template <>
struct create_document<1> final {
  uint16_t version{1};
  document_id_t document_id{};
  document_kind_t kind{document_kind_t::sales_invoice};
  std::string number;
  std::string contact;
  date_t issue_date{};
  date_t due_date{};
  std::vector<document_line_t> lines;
};

using create_document_t = create_document<1>;

}  // namespace tally::schema
