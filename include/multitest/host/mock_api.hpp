#pragma once

#include <multitest/host/api.hpp>
#include <string>
#include <string_view>

namespace multitest::host {

/// Test implementation of the host api.
///
/// Human addresses have the form `<prefix>1<hex>` where `<hex>` is the
/// lowercase hex encoding of the canonical address bytes.
class mock_api final : public api {
 public:
  explicit mock_api(std::string prefix = "cosmwasm");

  common::result<multitest::schema::addr_t> addr_validate(
      std::string_view human) const override;
  common::result<multitest::schema::bytes_t> addr_canonicalize(
      std::string_view human) const override;
  common::result<multitest::schema::addr_t> addr_humanize(
      const multitest::schema::bytes_view_t& canonical) const override;
  common::result<bool> secp256k1_verify(
      const multitest::schema::bytes_view_t& message_hash,
      const multitest::schema::bytes_view_t& signature,
      const multitest::schema::bytes_view_t& public_key) const override;
  common::result<bool> ed25519_verify(
      const multitest::schema::bytes_view_t& message,
      const multitest::schema::bytes_view_t& signature,
      const multitest::schema::bytes_view_t& public_key) const override;
  void debug(std::string_view message) const override;

  /// Deterministic valid address derived from the BLAKE3 hash of `label`.
  multitest::schema::addr_t addr_make(std::string_view label) const;

  const std::string& prefix() const;

 private:
  std::string prefix_;
};

}  // namespace multitest::host
