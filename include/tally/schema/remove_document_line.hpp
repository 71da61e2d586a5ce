#pragma once
#include <tally/schema/primitives.hpp>

namespace tally::schema {

template <uint16_t Version>
struct remove_document_line;

template <>
struct remove_document_line<1> final {
  uint16_t version{1};
  document_id_t document_id{};
  uint32_t line_index{};
};

using remove_document_line_t = remove_document_line<1>;

}  // namespace tally::schema
