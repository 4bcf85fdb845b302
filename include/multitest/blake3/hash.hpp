#pragma once
#include <multitest/schema/primitives.hpp>
#include <string_view>

namespace multitest::blake3 {

multitest::schema::hash32_t hash(const std::string_view& str);
multitest::schema::hash32_t hash(const multitest::schema::bytes_view_t& bytes);

}  // namespace multitest::blake3
