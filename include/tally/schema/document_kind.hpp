#pragma once

#include <tally/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace tally::schema {

enum class document_kind_t : uint8_t {
  sales_invoice = 0,
  supplier_bill = 1,
  credit_note = 2,
  debit_note = 3
};

inline constexpr auto kDocumentKindMappings = std::array{
    std::pair<std::string_view, document_kind_t>{"sales_invoice", document_kind_t::sales_invoice},
    std::pair<std::string_view, document_kind_t>{"supplier_bill", document_kind_t::supplier_bill},
    std::pair<std::string_view, document_kind_t>{"credit_note", document_kind_t::credit_note},
    std::pair<std::string_view, document_kind_t>{"debit_note", document_kind_t::debit_note}};

template <>
inline std::optional<document_kind_t> try_from_string<document_kind_t>(
    const std::string_view value) {
  return from_string(value, kDocumentKindMappings);
}

inline constexpr std::string_view to_string(const document_kind_t value) {
  return to_string(value, kDocumentKindMappings).value_or("unknown");
}

inline constexpr bool is_note(const document_kind_t value) {
  return value == document_kind_t::credit_note ||
         value == document_kind_t::debit_note;
}

/// Kind whose postings a note mirrors.
inline constexpr document_kind_t base_kind(const document_kind_t value) {
  switch (value) {
    case document_kind_t::credit_note:
      return document_kind_t::sales_invoice;
    case document_kind_t::debit_note:
      return document_kind_t::supplier_bill;
    default:
      return value;
  }
}

inline constexpr document_kind_t note_kind_for(const document_kind_t value) {
  return base_kind(value) == document_kind_t::sales_invoice
             ? document_kind_t::credit_note
             : document_kind_t::debit_note;
}

}  // namespace tally::schema
