#pragma once

#include <tally/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace tally::schema {

template <uint16_t Version>
struct operation_result;

template <>
struct operation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
  // Record created or resolved by the command, when there is one.
  std::optional<hash32_t> subject_id;
};

using operation_result_t = operation_result<1>;

}  // namespace tally::schema
