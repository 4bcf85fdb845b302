#pragma once

#include <multitest/common/error.hpp>
#include <multitest/host/deps.hpp>
#include <multitest/schema/bank_msg.hpp>
#include <multitest/schema/coin.hpp>
#include <multitest/schema/distribution_msg.hpp>
#include <multitest/schema/empty.hpp>
#include <multitest/schema/encoding/scale/encoder.hpp>
#include <multitest/schema/env.hpp>
#include <multitest/schema/event.hpp>
#include <multitest/schema/primitives.hpp>
#include <multitest/schema/reply.hpp>
#include <multitest/schema/response.hpp>
#include <multitest/schema/staking_msg.hpp>
#include <multitest/schema/sub_msg.hpp>
#include <multitest/schema/wasm_msg.hpp>
#include <multitest/storage/storage.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

// Small counter contract written against the baseline types only. Each entry
// point is a plain function so it can be bound with its message type read off
// the signature.
namespace multitest::testing {

struct counter_init_msg_t final {
  uint32_t start{};
};

struct increment_msg_t final {
  uint32_t by{};
};

struct reset_msg_t final {
  uint32_t value{};
};

struct migrate_msg_t final {
  std::string version;
};

inline constexpr auto kCounterKey = std::string_view{"count"};

inline uint32_t load_count(const multitest::storage::storage& storage) {
  auto encoder = multitest::schema::encoding::scale_encoder_t{};
  return storage
      .load<uint32_t>(encoder, multitest::schema::make_bytes_view(kCounterKey))
      .value_or(0);
}

inline void save_count(multitest::storage::storage& storage,
                       const uint32_t count) {
  auto encoder = multitest::schema::encoding::scale_encoder_t{};
  storage.save(encoder, multitest::schema::make_bytes_view(kCounterKey), count);
}

inline multitest::common::result<multitest::schema::response<>>
counter_instantiate(multitest::host::deps_mut<> deps,
                    const multitest::schema::env_t&,
                    const multitest::schema::message_info_t& info,
                    const counter_init_msg_t& msg) {
  save_count(deps.storage, msg.start);
  auto response = multitest::schema::response<>{};
  response.add_attribute("action", "instantiate")
      .add_attribute("owner", info.sender);
  return response;
}

/// Fails with a plain string error when asked to add nothing.
inline std::variant<multitest::schema::response<>, std::string>
counter_execute(multitest::host::deps_mut<> deps,
                const multitest::schema::env_t&,
                const multitest::schema::message_info_t&,
                const increment_msg_t& msg) {
  if (msg.by == 0) {
    return std::string{"increment must be positive"};
  }
  save_count(deps.storage, load_count(deps.storage) + msg.by);
  auto response = multitest::schema::response<>{};
  response.add_attribute("action", "increment");
  return response;
}

/// Answers with the SCALE encoded current count.
inline multitest::common::result<multitest::schema::binary_t> counter_query(
    multitest::host::deps<> deps,
    const multitest::schema::env_t&,
    const multitest::schema::empty_t&) {
  auto encoder = multitest::schema::encoding::scale_encoder_t{};
  return encoder.encode(load_count(deps.storage));
}

inline multitest::common::result<multitest::schema::response<>> counter_sudo(
    multitest::host::deps_mut<> deps,
    const multitest::schema::env_t&,
    const reset_msg_t& msg) {
  save_count(deps.storage, msg.value);
  auto response = multitest::schema::response<>{};
  response.add_attribute("action", "reset");
  return response;
}

inline multitest::common::result<multitest::schema::response<>> counter_reply(
    multitest::host::deps_mut<>,
    const multitest::schema::env_t&,
    const multitest::schema::reply_t& reply) {
  if (std::holds_alternative<std::string>(reply.result)) {
    return multitest::common::error{std::get<std::string>(reply.result)}
        .context("sub-message failed");
  }
  auto response = multitest::schema::response<>{};
  response.add_attribute("reply_id", std::to_string(reply.id));
  return response;
}

/// Throws instead of returning an error to exercise exception folding.
inline multitest::schema::response<> counter_migrate(
    multitest::host::deps_mut<>,
    const multitest::schema::env_t&,
    const migrate_msg_t& msg) {
  if (msg.version.empty()) {
    throw std::invalid_argument{"migrate version required"};
  }
  auto response = multitest::schema::response<>{};
  response.add_attribute("action", "migrate")
      .add_attribute("version", msg.version);
  return response;
}

/// Baseline response carrying one message of every structural family.
inline multitest::schema::response<> make_mixed_response() {
  auto response = multitest::schema::response<>{};
  response
      .add_message(multitest::schema::bank_msg_t{multitest::schema::bank_send_t{
          .to_address = "cosmwasm1recipient",
          .amount = {multitest::schema::make_coin(100, "uatom")}}})
      .add_submessage(multitest::schema::make_sub_msg<>(
          7,
          multitest::schema::cosmos_msg<>{multitest::schema::staking_msg_t{
              multitest::schema::staking_delegate_t{
                  .validator = "validator",
                  .amount = multitest::schema::make_coin(5, "ustake")}}},
          multitest::schema::reply_on_t::success, 250'000))
      .add_message(multitest::schema::distribution_msg_t{
          multitest::schema::distribution_withdraw_delegator_reward_t{
              .validator = "validator"}})
      .add_submessage(multitest::schema::make_sub_msg<>(
          9,
          multitest::schema::cosmos_msg<>{
              multitest::schema::wasm_msg_t{multitest::schema::wasm_execute_t{
                  .contract_addr = "cosmwasm1other",
                  .msg = multitest::schema::binary_t{0x01, 0x02}}}},
          multitest::schema::reply_on_t::always))
      .add_attribute("action", "mixed")
      .add_event(multitest::schema::make_event("transfer").add_attribute(
          "amount", "100uatom"))
      .set_data(multitest::schema::binary_t{0xCA, 0xFE});
  return response;
}

}  // namespace multitest::testing
