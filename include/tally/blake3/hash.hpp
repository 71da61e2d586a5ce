#pragma once
#include <tally/schema/primitives.hpp>
#include <string_view>

namespace tally::blake3 {

tally::schema::hash32_t hash(const std::string_view& str);

/// BLAKE3 in key derivation mode. `context` is a fixed, application-wide
/// string; ids derived under different contexts are independent even for
/// identical material.
tally::schema::hash32_t derive(const std::string_view& context,
                               const tally::schema::bytes_view_t& material);

}  // namespace tally::blake3
