#pragma once
#include <tally/schema/primitives.hpp>
#include <string>

namespace tally::schema {

template <uint16_t Version>
struct ignore_feed_item;

template <>
struct ignore_feed_item<1> final {
  uint16_t version{1};
  hash32_t import_id{};
  std::string fit_id;
};

using ignore_feed_item_t = ignore_feed_item<1>;

}  // namespace tally::schema
