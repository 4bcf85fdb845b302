#pragma once

#include <multitest/common/error.hpp>
#include <multitest/schema/primitives.hpp>

namespace multitest::crypto {

/// True when the linked OpenSSL provides both ed25519 and secp256k1.
bool available();

/// Verify a compact [r || s] secp256k1 signature over a 32 byte message hash.
///
/// The public key may be compressed (33 bytes) or uncompressed (65 bytes).
/// Malformed inputs are errors; a well-formed signature that does not match
/// yields false.
common::result<bool> secp256k1_verify(
    const multitest::schema::bytes_view_t& message_hash,
    const multitest::schema::bytes_view_t& signature,
    const multitest::schema::bytes_view_t& public_key);

/// Verify a 64 byte ed25519 signature over an arbitrary message.
common::result<bool> ed25519_verify(
    const multitest::schema::bytes_view_t& message,
    const multitest::schema::bytes_view_t& signature,
    const multitest::schema::bytes_view_t& public_key);

}  // namespace multitest::crypto
