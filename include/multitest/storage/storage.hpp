#pragma once
#include <multitest/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace multitest::storage {

using key_value_entry_t =
    std::pair<multitest::schema::bytes_t, multitest::schema::bytes_t>;

enum class order_t : uint8_t { ascending = 0, descending = 1 };

/// Key/value store lent to a contract through its request context.
///
/// Keys compare bytewise. A contract call holds the store exclusively when it
/// receives it through `deps_mut`, and read-only through `deps`.
class storage {
 public:
  virtual ~storage() = default;

  /// Value at key, or std::nullopt when missing.
  virtual std::optional<multitest::schema::bytes_t> get(
      const multitest::schema::bytes_view_t& key) const = 0;

  /// Insert or overwrite the value at key.
  virtual void set(const multitest::schema::bytes_view_t& key,
                   const multitest::schema::bytes_view_t& value) = 0;

  virtual void remove(const multitest::schema::bytes_view_t& key) = 0;

  /// Entries with start <= key < end in the requested order. A missing bound
  /// leaves that side open.
  virtual std::vector<key_value_entry_t> range(
      const std::optional<multitest::schema::bytes_view_t>& start,
      const std::optional<multitest::schema::bytes_view_t>& end,
      order_t order) const = 0;

  /// Decode the value at key with the given encoder.
  template <typename T, typename Encoder>
  std::optional<T> load(Encoder& encoder,
                        const multitest::schema::bytes_view_t& key) const {
    auto raw = get(key);
    if (!raw) {
      return std::nullopt;
    }
    return encoder.template decode<T>(
        multitest::schema::bytes_view_t{raw->data(), raw->size()});
  }

  /// Encode value and store it at key.
  template <typename T, typename Encoder>
  void save(Encoder& encoder,
            const multitest::schema::bytes_view_t& key,
            const T& value) {
    auto encoded = encoder.encode(value);
    set(key, multitest::schema::bytes_view_t{encoded.data(), encoded.size()});
  }
};

/// Concrete backends are selected by tag.
template <typename Library>
class backend;

}  // namespace multitest::storage
