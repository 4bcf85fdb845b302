#pragma once

#include <exception>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace multitest::common {

/// Uniform failure value returned by every contract entry point.
///
/// Holds a human-readable cause chain, outermost message first. Decoding
/// failures, handler failures and missing entry points all share this type;
/// the rendered message is the only thing a caller can rely on.
class error final {
 public:
  explicit error(std::string message);

  /// Return a copy wrapped in an outer message.
  error context(std::string message) const;

  /// Outermost message.
  const std::string& message() const;

  /// Innermost message (the original cause).
  const std::string& root_cause() const;

  /// Every message in the chain, outermost first.
  const std::vector<std::string>& chain() const;

  /// Render the chain as "outer: inner: root".
  std::string what() const;

  bool operator==(const error& other) const = default;

 private:
  std::vector<std::string> chain_;
};

template <typename T>
using result = std::variant<T, error>;

template <typename T>
bool is_ok(const result<T>& r) {
  return std::holds_alternative<T>(r);
}

template <typename T>
const T& value(const result<T>& r) {
  return std::get<T>(r);
}

template <typename T>
T& value(result<T>& r) {
  return std::get<T>(r);
}

template <typename T>
const error& error_of(const result<T>& r) {
  return std::get<error>(r);
}

inline error to_error(error e) {
  return e;
}

inline error to_error(const std::string& message) {
  return error{message};
}

inline error to_error(const std::string_view message) {
  return error{std::string{message}};
}

inline error to_error(const char* message) {
  return error{std::string{message}};
}

template <typename E,
          typename = std::enable_if_t<std::is_base_of_v<std::exception, E>>>
error to_error(const E& ex) {
  return error{ex.what()};
}

/// True when a handler error type E can be normalized into `error`.
template <typename E, typename = void>
struct is_error_convertible : std::false_type {};

template <typename E>
struct is_error_convertible<
    E,
    std::void_t<decltype(to_error(std::declval<const E&>()))>>
    : std::true_type {};

template <typename E>
inline constexpr bool is_error_convertible_v = is_error_convertible<E>::value;

}  // namespace multitest::common
