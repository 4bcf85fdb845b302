#pragma once

#include <multitest/schema/coin.hpp>
#include <multitest/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// Schema type: wasm message.
// Contract-to-contract calls and contract lifecycle operations. `msg` is the
// encoded payload the target contract's entry point decodes.
namespace multitest::schema {

struct wasm_execute_t final {
  addr_t contract_addr;
  binary_t msg;
  std::vector<coin_t> funds;

  bool operator==(const wasm_execute_t&) const = default;
};

struct wasm_instantiate_t final {
  std::optional<addr_t> admin;
  uint64_t code_id{};
  binary_t msg;
  std::vector<coin_t> funds;
  std::string label;

  bool operator==(const wasm_instantiate_t&) const = default;
};

struct wasm_migrate_t final {
  addr_t contract_addr;
  uint64_t new_code_id{};
  binary_t msg;

  bool operator==(const wasm_migrate_t&) const = default;
};

struct wasm_update_admin_t final {
  addr_t contract_addr;
  addr_t admin;

  bool operator==(const wasm_update_admin_t&) const = default;
};

struct wasm_clear_admin_t final {
  addr_t contract_addr;

  bool operator==(const wasm_clear_admin_t&) const = default;
};

using wasm_msg_t = std::variant<wasm_execute_t,
                                wasm_instantiate_t,
                                wasm_migrate_t,
                                wasm_update_admin_t,
                                wasm_clear_admin_t>;

}  // namespace multitest::schema
