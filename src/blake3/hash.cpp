#include <blake3.h>
#include <tally/blake3/hash.hpp>
#include <string>
#include <tuple>

namespace tally::blake3 {

static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<tally::schema::hash32_t>);

tally::schema::hash32_t hash(const std::string_view& str) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, str.data(), str.size());
  auto digest = tally::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, digest.data(), digest.size());
  return digest;
}

tally::schema::hash32_t derive(const std::string_view& context,
                               const tally::schema::bytes_view_t& material) {
  auto hasher = blake3_hasher{};
  // The C API takes a NUL-terminated context.
  blake3_hasher_init_derive_key(&hasher, std::string{context}.c_str());
  blake3_hasher_update(&hasher, material.data(), material.size());
  auto digest = tally::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, digest.data(), digest.size());
  return digest;
}

}  // namespace tally::blake3
