#include <blake3.h>
#include <tally/blake3/hash.hpp>

namespace tally::blake3 {

namespace {

tally::schema::hash32_t digest(const void* data, size_t size) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, size);
  auto output = tally::schema::hash32_t{};
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<tally::schema::hash32_t>);
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

tally::schema::hash32_t hash(const std::string_view& str) {
  return digest(str.data(), str.size());
}

tally::schema::hash32_t hash(const tally::schema::bytes_view_t& bytes) {
  return digest(bytes.data(), bytes.size());
}

}  // namespace tally::blake3
