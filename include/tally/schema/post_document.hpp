#pragma once
#include <tally/schema/primitives.hpp>

namespace tally::schema {

template <uint16_t Version>
struct post_document;

template <>
struct post_document<1> final {
  uint16_t version{1};
  document_id_t document_id{};
};

using post_document_t = post_document<1>;

}  // namespace tally::schema
