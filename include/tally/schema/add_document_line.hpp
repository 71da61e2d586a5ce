#pragma once
#include <tally/schema/document_line.hpp>
#include <tally/schema/primitives.hpp>

namespace tally::schema {

template <uint16_t Version>
struct add_document_line;

template <>
struct add_document_line<1> final {
  uint16_t version{1};
  document_id_t document_id{};
  document_line_t line;
};

using add_document_line_t = add_document_line<1>;

}  // namespace tally::schema
