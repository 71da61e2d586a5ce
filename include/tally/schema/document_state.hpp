#pragma once
#include <tally/schema/document_kind.hpp>
#include <tally/schema/document_line.hpp>
#include <tally/schema/posting_status.hpp>
#include <tally/schema/primitives.hpp>
#include <optional>
#include <string>
#include <vector>

namespace tally::schema {

template <uint16_t Version>
struct document_state;

// Allocatable document: sales invoice, supplier bill, or a note against one.
template <>
struct document_state<1> final {
  uint16_t version{1};
  company_id_t company_id{};
  document_id_t document_id{};
  document_kind_t kind{document_kind_t::sales_invoice};
  posting_status_t status{posting_status_t::draft};
  std::string number;
  std::string contact;
  date_t issue_date{};
  date_t due_date{};
  std::vector<document_line_t> lines;
  // Cache of the allocation rows against this document.
  amount_t amount_paid{};
  std::optional<document_id_t> original_document_id;
  std::optional<transaction_id_t> posted_transaction_id;
  uint64_t revision{};
};

using document_state_t = document_state<1>;

inline amount_t net_total(const document_state_t& document) {
  auto total = amount_t{};
  for (const auto& line : document.lines) {
    total += line.net_amount;
  }
  return total;
}

inline amount_t tax_total(const document_state_t& document) {
  auto total = amount_t{};
  for (const auto& line : document.lines) {
    total += line.tax_amount;
  }
  return total;
}

inline amount_t total(const document_state_t& document) {
  return net_total(document) + tax_total(document);
}

inline amount_t balance(const document_state_t& document) {
  return total(document) - document.amount_paid;
}

}  // namespace tally::schema
