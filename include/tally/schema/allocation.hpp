#pragma once
#include <tally/schema/primitives.hpp>

namespace tally::schema {

template <uint16_t Version>
struct allocation;

// Links one source transaction (cash movement or a note posting) to one
// document.
template <>
struct allocation<1> final {
  uint16_t version{1};
  company_id_t company_id{};
  transaction_id_t source_transaction_id{};
  document_id_t document_id{};
  amount_t amount{};
  // Business date of the source transaction; aging ignores later rows.
  date_t effective_date{};
  timestamp_milliseconds_t allocated_at{};
  actor_id_t allocated_by{};
};

using allocation_t = allocation<1>;

}  // namespace tally::schema
