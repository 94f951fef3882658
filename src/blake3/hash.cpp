#include <blake3.h>
#include <depot/blake3/hash.hpp>

namespace depot::blake3 {

depot::schema::hash32_t hash(const std::string_view& str) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, str.data(), str.size());
  static_assert(BLAKE3_OUT_LEN == sizeof(depot::schema::hash32_t));
  auto output = depot::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

depot::schema::hash32_t hash(const depot::schema::bytes_view_t& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  auto output = depot::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

depot::schema::hash32_t chain(const depot::schema::hash32_t& previous,
                              const depot::schema::bytes_view_t& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, previous.data(), previous.size());
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  auto output = depot::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace depot::blake3
