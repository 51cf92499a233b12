#include <blake3.h>
#include <ferry/blake3/hash.hpp>

#include <tuple>

namespace ferry::blake3 {

ferry::schema::hash32_t hash(const ferry::schema::bytes_view_t& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  auto output = ferry::schema::hash32_t{};
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<ferry::schema::hash32_t>);
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace ferry::blake3
