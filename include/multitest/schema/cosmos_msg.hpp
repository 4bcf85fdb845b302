#pragma once

#include <multitest/schema/bank_msg.hpp>
#include <multitest/schema/distribution_msg.hpp>
#include <multitest/schema/empty.hpp>
#include <multitest/schema/gov_msg.hpp>
#include <multitest/schema/ibc_msg.hpp>
#include <multitest/schema/staking_msg.hpp>
#include <multitest/schema/wasm_msg.hpp>
#include <variant>

// Schema type: cosmos message.
// Outbound message a contract asks the host to dispatch after the call. `C`
// is the chain-specific extension carried by the custom alternative; with
// `empty_t` the custom alternative is never produced.
namespace multitest::schema {

template <typename C>
struct custom_msg final {
  C value;

  bool operator==(const custom_msg&) const = default;
};

template <typename C = empty_t>
using cosmos_msg = std::variant<bank_msg_t,
                                custom_msg<C>,
                                staking_msg_t,
                                distribution_msg_t,
                                stargate_msg_t,
                                ibc_msg_t,
                                wasm_msg_t,
                                gov_msg_t>;

}  // namespace multitest::schema
