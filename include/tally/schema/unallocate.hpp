#pragma once
#include <tally/schema/primitives.hpp>

namespace tally::schema {

template <uint16_t Version>
struct unallocate;

template <>
struct unallocate<1> final {
  uint16_t version{1};
  transaction_id_t source_transaction_id{};
  document_id_t document_id{};
};

using unallocate_t = unallocate<1>;

}  // namespace tally::schema
