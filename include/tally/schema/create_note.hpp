#pragma once
#include <tally/schema/primitives.hpp>
#include <optional>
#include <string>

namespace tally::schema {

template <uint16_t Version>
struct create_note;

template <>
struct create_note<1> final {
  uint16_t version{1};
  document_id_t note_id{};
  document_id_t original_document_id{};
  // Generated from the original number when empty.
  std::optional<std::string> number;
  date_t issue_date{};
  bool copy_lines{};
};

using create_note_t = create_note<1>;

}  // namespace tally::schema
