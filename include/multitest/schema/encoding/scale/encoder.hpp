#pragma once
#include <multitest/common/critical.hpp>
#include <multitest/schema/encoding/encoder.hpp>
#include <multitest/schema/encoding/scale/empty.hpp>
#include <exception>
#include <iterator>
#include <scale/scale.hpp>
#include <string>
#include <utility>

namespace multitest::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  multitest::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, multitest::schema::bytes_t& out);

  template <typename T>
  T decode(const multitest::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const multitest::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const multitest::schema::bytes_view_t& bytes,
                              std::string& error);
};

using scale_encoder_t = encoder<scale_encoder_tag>;

template <typename T>
multitest::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    multitest::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        multitest::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const multitest::schema::bytes_view_t& bytes) {
  auto error = std::string{};
  auto decoded = try_decode<T>(bytes, error);
  if (!decoded) {
    multitest::common::critical("failed to decode SCALE bytes: " + error);
  }
  return std::move(decoded.value());
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const multitest::schema::bytes_view_t& bytes) {
  auto error = std::string{};
  return try_decode<T>(bytes, error);
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const multitest::schema::bytes_view_t& bytes,
    std::string& error) {
  try {
    auto decoded = ::scale::impl::memory::decode<T>(bytes);
    if (!decoded) {
      error = decoded.error().message();
      return std::nullopt;
    }
    // The codec stops at the end of the value; a payload for another, shorter
    // type leaves bytes behind.
    auto canonical = ::scale::impl::memory::encode(decoded.value());
    if (!canonical || canonical.value().size() != bytes.size()) {
      error = "unexpected trailing bytes after SCALE value";
      return std::nullopt;
    }
    return std::move(decoded.value());
  } catch (const std::exception& ex) {
    error = ex.what();
    return std::nullopt;
  }
}

}  // namespace multitest::schema::encoding
