#pragma once
#include <tally/schema/primitives.hpp>
#include <optional>
#include <string>

namespace tally::schema {

template <uint16_t Version>
struct void_document;

template <>
struct void_document<1> final {
  uint16_t version{1};
  document_id_t document_id{};
  std::string reason;
  std::optional<date_t> reversal_date;
};

using void_document_t = void_document<1>;

}  // namespace tally::schema
