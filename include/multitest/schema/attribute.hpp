#pragma once

#include <cstdint>
#include <string>

// Schema type: attribute.
// Key/value pair attached either to a response directly or to an event.
namespace multitest::schema {

template <uint16_t Version>
struct attribute;

template <>
struct attribute<1> final {
  uint16_t version{1};
  std::string key;
  std::string value;

  bool operator==(const attribute&) const = default;
};

using attribute_t = attribute<1>;

}  // namespace multitest::schema
