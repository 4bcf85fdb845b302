#pragma once

#include <multitest/schema/cosmos_msg.hpp>
#include <multitest/schema/empty.hpp>
#include <multitest/schema/enum_string.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

// Schema type: sub-message.
// Envelope around an outbound message: correlation id, reply policy and gas
// ceiling used by the host when dispatching it.
namespace multitest::schema {

enum class reply_on_t : uint8_t {
  always = 0,
  error = 1,
  success = 2,
  never = 3
};

inline constexpr auto kReplyOnMappings = std::array{
    std::pair<std::string_view, reply_on_t>{"always", reply_on_t::always},
    std::pair<std::string_view, reply_on_t>{"error", reply_on_t::error},
    std::pair<std::string_view, reply_on_t>{"success", reply_on_t::success},
    std::pair<std::string_view, reply_on_t>{"never", reply_on_t::never},
};

template <>
inline std::optional<reply_on_t> try_from_string<reply_on_t>(
    const std::string_view value) {
  return from_string(value, kReplyOnMappings);
}

inline constexpr std::string_view to_string(const reply_on_t value) {
  return name_or_unknown(value, kReplyOnMappings);
}

template <typename C = empty_t>
struct sub_msg final {
  uint64_t id{};
  cosmos_msg<C> msg;
  std::optional<uint64_t> gas_limit;
  reply_on_t reply_on{reply_on_t::never};

  bool operator==(const sub_msg&) const = default;
};

/// Fire-and-forget envelope: no reply, no gas ceiling.
template <typename C>
sub_msg<C> make_sub_msg(cosmos_msg<C> msg) {
  return sub_msg<C>{.id = 0, .msg = std::move(msg)};
}

template <typename C>
sub_msg<C> make_sub_msg(const uint64_t id,
                        cosmos_msg<C> msg,
                        const reply_on_t reply_on,
                        const std::optional<uint64_t> gas_limit = std::nullopt) {
  return sub_msg<C>{.id = id,
                    .msg = std::move(msg),
                    .gas_limit = gas_limit,
                    .reply_on = reply_on};
}

}  // namespace multitest::schema
