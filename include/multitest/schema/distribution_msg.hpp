#pragma once

#include <multitest/schema/primitives.hpp>
#include <string>
#include <variant>

// Schema type: distribution message.
// Staking reward handling for the contract account.
namespace multitest::schema {

struct distribution_set_withdraw_address_t final {
  addr_t address;

  bool operator==(const distribution_set_withdraw_address_t&) const = default;
};

struct distribution_withdraw_delegator_reward_t final {
  std::string validator;

  bool operator==(const distribution_withdraw_delegator_reward_t&) const =
      default;
};

using distribution_msg_t =
    std::variant<distribution_set_withdraw_address_t,
                 distribution_withdraw_delegator_reward_t>;

}  // namespace multitest::schema
