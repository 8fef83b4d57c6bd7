#include <blake3.h>
#include <popchain/blake3/hash.hpp>

namespace popchain::blake3 {

namespace {

popchain::schema::hash32_t finalize(blake3_hasher& hasher) {
  auto output = popchain::schema::hash32_t{};
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<popchain::schema::hash32_t>);
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

popchain::schema::hash32_t hash(const std::string_view& str) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, str.data(), str.size());
  return finalize(hasher);
}

popchain::schema::hash32_t hash(const popchain::schema::bytes_view_t& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  return finalize(hasher);
}

popchain::schema::hash32_t hash(
    std::initializer_list<popchain::schema::bytes_view_t> parts) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  for (const auto& part : parts) {
    blake3_hasher_update(&hasher, part.data(), part.size());
  }
  return finalize(hasher);
}

}  // namespace popchain::blake3
