#include <blake3.h>
#include <combo/blake3/hash.hpp>

namespace combo::blake3 {

namespace {

combo::schema::hash32_t digest(const void* input, const size_t size) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, input, size);
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<combo::schema::hash32_t>);
  auto output = combo::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

combo::schema::hash32_t hash(const std::string_view& str) {
  return digest(str.data(), str.size());
}

combo::schema::hash32_t hash(const combo::schema::bytes_view_t& bytes) {
  return digest(bytes.data(), bytes.size());
}

}  // namespace combo::blake3
