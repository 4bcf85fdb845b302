#pragma once

#include <multitest/schema/coin.hpp>
#include <multitest/schema/empty.hpp>
#include <multitest/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// Schema type: query request.
// Read queries a contract may issue against chain state while handling a
// call. `Q` is the chain-specific extension carried by the custom
// alternative.
namespace multitest::schema {

struct bank_balance_query_t final {
  addr_t address;
  std::string denom;
};

struct bank_all_balances_query_t final {
  addr_t address;
};

using bank_query_t =
    std::variant<bank_balance_query_t, bank_all_balances_query_t>;

struct staking_bonded_denom_query_t final {};

struct staking_all_validators_query_t final {};

struct staking_validator_query_t final {
  std::string address;
};

struct staking_all_delegations_query_t final {
  addr_t delegator;
};

using staking_query_t = std::variant<staking_bonded_denom_query_t,
                                     staking_all_validators_query_t,
                                     staking_validator_query_t,
                                     staking_all_delegations_query_t>;

struct wasm_smart_query_t final {
  addr_t contract_addr;
  binary_t msg;
};

struct wasm_raw_query_t final {
  addr_t contract_addr;
  binary_t key;
};

struct wasm_contract_info_query_t final {
  addr_t contract_addr;
};

using wasm_query_t = std::variant<wasm_smart_query_t,
                                  wasm_raw_query_t,
                                  wasm_contract_info_query_t>;

template <typename Q>
struct custom_query final {
  Q value;
};

template <typename Q = empty_t>
using query_request =
    std::variant<bank_query_t, custom_query<Q>, staking_query_t, wasm_query_t>;

struct validator_t final {
  std::string address;
  uint64_t commission_bps{};

  bool operator==(const validator_t&) const = default;
};

struct delegation_t final {
  addr_t delegator;
  std::string validator;
  coin_t amount;

  bool operator==(const delegation_t&) const = default;
};

struct contract_info_response_t final {
  uint64_t code_id{};
  addr_t creator;
  std::optional<addr_t> admin;

  bool operator==(const contract_info_response_t&) const = default;
};

}  // namespace multitest::schema
