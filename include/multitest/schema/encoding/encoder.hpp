#pragma once
#include <multitest/schema/primitives.hpp>
#include <optional>
#include <span>
#include <string>

namespace multitest::schema::encoding {

/// Codec facade selected at build time by tag.
///
/// Contracts and the host only ever see byte payloads; this is the single
/// place those payloads are turned into typed values and back.
template <typename Library>
struct encoder {
  template <typename T>
  multitest::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, multitest::schema::bytes_t& out);

  /// Decode or terminate; for payloads produced by this process.
  template <typename T>
  T decode(const multitest::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const multitest::schema::bytes_view_t& bytes);

  /// Decode untrusted input. On failure `error` names the reason.
  template <typename T>
  std::optional<T> try_decode(const multitest::schema::bytes_view_t& bytes,
                              std::string& error);
};

}  // namespace multitest::schema::encoding
