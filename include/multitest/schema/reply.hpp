#pragma once

#include <multitest/schema/event.hpp>
#include <multitest/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// Schema type: reply.
// Outcome of a dispatched sub-message, handed back to the contract that
// emitted it. The error alternative carries the failure rendered as text.
namespace multitest::schema {

struct sub_msg_response_t final {
  std::vector<event_t> events;
  std::optional<binary_t> data;

  bool operator==(const sub_msg_response_t&) const = default;
};

using sub_msg_result_t = std::variant<sub_msg_response_t, std::string>;

template <uint16_t Version>
struct reply;

template <>
struct reply<1> final {
  uint16_t version{1};
  uint64_t id{};
  sub_msg_result_t result;

  bool operator==(const reply&) const = default;
};

using reply_t = reply<1>;

}  // namespace multitest::schema
