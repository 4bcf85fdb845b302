#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <utility>

namespace multitest::schema {

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view value,
    const std::array<std::pair<std::string_view, Enum>, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (name == value) {
      return enum_value;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const std::array<std::pair<std::string_view, Enum>, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (enum_value == value) {
      return name;
    }
  }
  return std::nullopt;
}

/// Wire name of an enum value, or "unknown" for a value outside the table.
/// Used for log lines and diagnostics where a missing name must not fail.
template <typename Enum, std::size_t N>
constexpr std::string_view name_or_unknown(
    const Enum value,
    const std::array<std::pair<std::string_view, Enum>, N>& mappings) {
  return to_string(value, mappings).value_or(std::string_view{"unknown"});
}

/// Specialized next to each enum that supports parsing.
template <typename Enum>
std::optional<Enum> try_from_string(const std::string_view value) {
  static_cast<void>(value);
  return std::nullopt;
}

}  // namespace multitest::schema
