#pragma once

#include <multitest/schema/coin.hpp>
#include <multitest/schema/primitives.hpp>
#include <variant>
#include <vector>

// Schema type: bank message.
// Native token movements requested by a contract.
namespace multitest::schema {

struct bank_send_t final {
  addr_t to_address;
  std::vector<coin_t> amount;

  bool operator==(const bank_send_t&) const = default;
};

struct bank_burn_t final {
  std::vector<coin_t> amount;

  bool operator==(const bank_burn_t&) const = default;
};

using bank_msg_t = std::variant<bank_send_t, bank_burn_t>;

}  // namespace multitest::schema
