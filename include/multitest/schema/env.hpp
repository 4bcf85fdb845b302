#pragma once

#include <multitest/schema/coin.hpp>
#include <multitest/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: env / message info.
// Execution metadata the host passes with every call: the block being
// simulated, the position of the transaction and the called contract, plus
// the sender and attached funds for sender-aware entry points.
namespace multitest::schema {

struct block_info_t final {
  uint64_t height{};
  timestamp_nanoseconds_t time{};
  std::string chain_id;

  bool operator==(const block_info_t&) const = default;
};

struct transaction_info_t final {
  uint32_t index{};

  bool operator==(const transaction_info_t&) const = default;
};

struct contract_info_t final {
  addr_t address;

  bool operator==(const contract_info_t&) const = default;
};

template <uint16_t Version>
struct env;

template <>
struct env<1> final {
  uint16_t version{1};
  block_info_t block;
  std::optional<transaction_info_t> transaction;
  contract_info_t contract;

  bool operator==(const env&) const = default;
};

using env_t = env<1>;

template <uint16_t Version>
struct message_info;

template <>
struct message_info<1> final {
  uint16_t version{1};
  addr_t sender;
  std::vector<coin_t> funds;

  bool operator==(const message_info&) const = default;
};

using message_info_t = message_info<1>;

}  // namespace multitest::schema
