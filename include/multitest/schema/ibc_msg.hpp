#pragma once

#include <multitest/schema/coin.hpp>
#include <multitest/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

// Schema type: ibc / stargate message.
// Cross-chain packets and raw protocol messages. Only passed through when
// cross-chain support is compiled in (MULTITEST_STARGATE).
namespace multitest::schema {

struct ibc_timeout_block_t final {
  uint64_t revision{};
  uint64_t height{};

  bool operator==(const ibc_timeout_block_t&) const = default;
};

struct ibc_timeout_t final {
  std::optional<ibc_timeout_block_t> block;
  std::optional<timestamp_nanoseconds_t> timestamp;

  bool operator==(const ibc_timeout_t&) const = default;
};

struct ibc_transfer_t final {
  std::string channel_id;
  addr_t to_address;
  coin_t amount;
  ibc_timeout_t timeout;

  bool operator==(const ibc_transfer_t&) const = default;
};

struct ibc_send_packet_t final {
  std::string channel_id;
  binary_t data;
  ibc_timeout_t timeout;

  bool operator==(const ibc_send_packet_t&) const = default;
};

struct ibc_close_channel_t final {
  std::string channel_id;

  bool operator==(const ibc_close_channel_t&) const = default;
};

using ibc_msg_t =
    std::variant<ibc_transfer_t, ibc_send_packet_t, ibc_close_channel_t>;

struct stargate_msg_t final {
  std::string type_url;
  binary_t value;

  bool operator==(const stargate_msg_t&) const = default;
};

}  // namespace multitest::schema
