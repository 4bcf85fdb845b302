#pragma once

#include <multitest/schema/coin.hpp>
#include <multitest/schema/primitives.hpp>
#include <string>
#include <variant>

// Schema type: staking message.
// Delegation operations issued on behalf of the contract account.
namespace multitest::schema {

struct staking_delegate_t final {
  std::string validator;
  coin_t amount;

  bool operator==(const staking_delegate_t&) const = default;
};

struct staking_undelegate_t final {
  std::string validator;
  coin_t amount;

  bool operator==(const staking_undelegate_t&) const = default;
};

struct staking_redelegate_t final {
  std::string src_validator;
  std::string dst_validator;
  coin_t amount;

  bool operator==(const staking_redelegate_t&) const = default;
};

using staking_msg_t = std::variant<staking_delegate_t,
                                   staking_undelegate_t,
                                   staking_redelegate_t>;

}  // namespace multitest::schema
