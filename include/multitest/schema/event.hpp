#pragma once

#include <multitest/schema/attribute.hpp>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

// Schema type: event.
// Typed group of attributes emitted by a contract; emission order is kept.
namespace multitest::schema {

template <uint16_t Version>
struct event;

template <>
struct event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<attribute_t> attributes;

  event& add_attribute(std::string key, std::string value) {
    attributes.push_back(
        attribute_t{.key = std::move(key), .value = std::move(value)});
    return *this;
  }

  bool operator==(const event&) const = default;
};

using event_t = event<1>;

inline event_t make_event(std::string type) {
  return event_t{.type = std::move(type)};
}

}  // namespace multitest::schema
