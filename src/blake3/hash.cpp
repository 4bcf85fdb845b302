#include <blake3.h>
#include <multitest/blake3/hash.hpp>

namespace multitest::blake3 {

multitest::schema::hash32_t hash(const std::string_view& str) {
  return hash(multitest::schema::make_bytes_view(str));
}

multitest::schema::hash32_t hash(const multitest::schema::bytes_view_t& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  auto output = multitest::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace multitest::blake3
