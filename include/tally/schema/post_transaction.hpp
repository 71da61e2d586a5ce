#pragma once
#include <tally/schema/primitives.hpp>

namespace tally::schema {

template <uint16_t Version>
struct post_transaction;

template <>
struct post_transaction<1> final {
  uint16_t version{1};
  transaction_id_t transaction_id{};
};

using post_transaction_t = post_transaction<1>;

}  // namespace tally::schema
