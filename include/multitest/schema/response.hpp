#pragma once

#include <multitest/schema/attribute.hpp>
#include <multitest/schema/cosmos_msg.hpp>
#include <multitest/schema/empty.hpp>
#include <multitest/schema/event.hpp>
#include <multitest/schema/primitives.hpp>
#include <multitest/schema/sub_msg.hpp>
#include <iterator>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Schema type: response.
// Result of every state-mutating entry point: messages to dispatch, emitted
// events and attributes, and an optional opaque data payload.
namespace multitest::schema {

template <typename C = empty_t>
struct response final {
  std::vector<sub_msg<C>> messages;
  std::vector<attribute_t> attributes;
  std::vector<event_t> events;
  std::optional<binary_t> data;

  response& add_attribute(std::string key, std::string value) {
    attributes.push_back(
        attribute_t{.key = std::move(key), .value = std::move(value)});
    return *this;
  }

  response& add_attributes(std::vector<attribute_t> values) {
    attributes.insert(std::end(attributes),
                      std::make_move_iterator(std::begin(values)),
                      std::make_move_iterator(std::end(values)));
    return *this;
  }

  response& add_message(cosmos_msg<C> msg) {
    messages.push_back(make_sub_msg<C>(std::move(msg)));
    return *this;
  }

  response& add_submessage(sub_msg<C> msg) {
    messages.push_back(std::move(msg));
    return *this;
  }

  response& add_submessages(std::vector<sub_msg<C>> msgs) {
    messages.insert(std::end(messages),
                    std::make_move_iterator(std::begin(msgs)),
                    std::make_move_iterator(std::end(msgs)));
    return *this;
  }

  response& add_event(event_t value) {
    events.push_back(std::move(value));
    return *this;
  }

  response& add_events(std::vector<event_t> values) {
    events.insert(std::end(events), std::make_move_iterator(std::begin(values)),
                  std::make_move_iterator(std::end(values)));
    return *this;
  }

  response& set_data(binary_t value) {
    data = std::move(value);
    return *this;
  }

  bool operator==(const response&) const = default;
};

}  // namespace multitest::schema
