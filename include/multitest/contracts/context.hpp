#pragma once

#include <multitest/common/critical.hpp>
#include <multitest/host/deps.hpp>
#include <multitest/host/querier.hpp>
#include <multitest/schema/cosmos_msg.hpp>
#include <multitest/schema/empty.hpp>
#include <multitest/schema/response.hpp>
#include <multitest/schema/sub_msg.hpp>
#include <iterator>
#include <utility>
#include <variant>

// Conversions between the baseline extension type and chain-specific ones.
//
// Request contexts only narrow (any Q -> empty_t): a handler written against
// the baseline query surface may run under any host. Messages and responses
// only widen (empty_t -> any C): whatever a baseline handler emits is valid on
// any chain.
namespace multitest::contracts {

/// Present a mutable context to a baseline-typed handler. Storage and api are
/// lent through unchanged; the querier is the same dispatcher viewed through
/// the baseline query type.
template <typename Q>
host::deps_mut<schema::empty_t> customize_deps(host::deps_mut<Q>& deps) {
  return host::deps_mut<schema::empty_t>{
      deps.storage, deps.api,
      host::querier_wrapper<schema::empty_t>{deps.querier.inner()}};
}

template <typename Q>
host::deps<schema::empty_t> customize_deps(const host::deps<Q>& deps) {
  return host::deps<schema::empty_t>{
      deps.storage, deps.api,
      host::querier_wrapper<schema::empty_t>{deps.querier.inner()}};
}

/// Re-type a baseline message for extension type C.
///
/// Total for every message a baseline handler can build. A custom message
/// under the baseline type, or a variant this mapping does not carry, is a
/// broken invariant and terminates.
template <typename C>
schema::cosmos_msg<C> customize_msg(schema::cosmos_msg<schema::empty_t> msg) {
  if (msg.valueless_by_exception()) {
    common::critical("unknown message variant: valueless");
  }
  return std::visit(
      overloaded{
          [](schema::bank_msg_t&& value) {
            return schema::cosmos_msg<C>{std::in_place_type<schema::bank_msg_t>,
                                         std::move(value)};
          },
          [](schema::custom_msg<schema::empty_t>&&) -> schema::cosmos_msg<C> {
            common::critical(
                "custom message variant built under the baseline extension "
                "type");
          },
          [](schema::staking_msg_t&& value) {
            return schema::cosmos_msg<C>{
                std::in_place_type<schema::staking_msg_t>, std::move(value)};
          },
          [](schema::distribution_msg_t&& value) {
            return schema::cosmos_msg<C>{
                std::in_place_type<schema::distribution_msg_t>,
                std::move(value)};
          },
          [](schema::stargate_msg_t&& value) -> schema::cosmos_msg<C> {
#if MULTITEST_STARGATE
            return schema::cosmos_msg<C>{
                std::in_place_type<schema::stargate_msg_t>, std::move(value)};
#else
            static_cast<void>(value);
            common::critical("unknown message variant: stargate");
#endif
          },
          [](schema::ibc_msg_t&& value) -> schema::cosmos_msg<C> {
#if MULTITEST_STARGATE
            return schema::cosmos_msg<C>{std::in_place_type<schema::ibc_msg_t>,
                                         std::move(value)};
#else
            static_cast<void>(value);
            common::critical("unknown message variant: ibc");
#endif
          },
          [](schema::wasm_msg_t&& value) {
            return schema::cosmos_msg<C>{std::in_place_type<schema::wasm_msg_t>,
                                         std::move(value)};
          },
          [](schema::gov_msg_t&&) -> schema::cosmos_msg<C> {
            common::critical("unknown message variant: gov");
          }},
      std::move(msg));
}

/// Widen the payload; id, reply policy and gas limit are kept as they are.
template <typename C>
schema::sub_msg<C> customize_sub_msg(schema::sub_msg<schema::empty_t> msg) {
  return schema::sub_msg<C>{.id = msg.id,
                            .msg = customize_msg<C>(std::move(msg.msg)),
                            .gas_limit = msg.gas_limit,
                            .reply_on = msg.reply_on};
}

/// Widen every sub-message in order; attributes, events and data are carried
/// over untouched.
template <typename C>
schema::response<C> customize_response(
    schema::response<schema::empty_t> response) {
  auto widened = schema::response<C>{};
  widened.messages.reserve(response.messages.size());
  for (auto& msg : response.messages) {
    widened.messages.push_back(customize_sub_msg<C>(std::move(msg)));
  }
  widened.attributes = std::move(response.attributes);
  widened.events = std::move(response.events);
  widened.data = std::move(response.data);
  return widened;
}

}  // namespace multitest::contracts
