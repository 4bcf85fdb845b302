#pragma once

#include <multitest/common/error.hpp>
#include <multitest/schema/primitives.hpp>
#include <string_view>

namespace multitest::host {

/// Host capabilities available to a contract during a call.
///
/// Address handling and signature checks are delegated to the host so that
/// contracts stay independent of the chain's address format and crypto.
class api {
 public:
  virtual ~api() = default;

  /// Check that `human` is a valid, normalized address and return it.
  virtual common::result<multitest::schema::addr_t> addr_validate(
      std::string_view human) const = 0;

  virtual common::result<multitest::schema::bytes_t> addr_canonicalize(
      std::string_view human) const = 0;

  virtual common::result<multitest::schema::addr_t> addr_humanize(
      const multitest::schema::bytes_view_t& canonical) const = 0;

  virtual common::result<bool> secp256k1_verify(
      const multitest::schema::bytes_view_t& message_hash,
      const multitest::schema::bytes_view_t& signature,
      const multitest::schema::bytes_view_t& public_key) const = 0;

  virtual common::result<bool> ed25519_verify(
      const multitest::schema::bytes_view_t& message,
      const multitest::schema::bytes_view_t& signature,
      const multitest::schema::bytes_view_t& public_key) const = 0;

  /// Contract debug output.
  virtual void debug(std::string_view message) const = 0;
};

}  // namespace multitest::host
