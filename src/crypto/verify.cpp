#include <multitest/crypto/verify.hpp>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>

#include <array>
#include <memory>
#include <optional>
#include <vector>

namespace multitest::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;

constexpr auto kMessageHashLength = size_t{32};
constexpr auto kCompactSignatureLength = size_t{64};
constexpr auto kEd25519PublicKeyLength = size_t{32};
constexpr auto kCompressedPublicKeyLength = size_t{33};
constexpr auto kUncompressedPublicKeyLength = size_t{65};

bool openssl_has_ed25519() {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                              EVP_PKEY_CTX_free};
  return static_cast<bool>(ctx);
}

bool openssl_has_secp256k1() {
  auto ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  return static_cast<bool>(ctx);
}

std::optional<evp_pkey_ptr> make_secp256k1_key(
    const multitest::schema::bytes_view_t& public_key) {
  auto key_ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!key_ctx || EVP_PKEY_fromdata_init(key_ctx.get()) != 1) {
    return std::nullopt;
  }

  auto* group_name = const_cast<char*>("secp256k1");
  auto params =
      std::array{OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME,
                                                  group_name, 0),
                 OSSL_PARAM_construct_octet_string(
                     OSSL_PKEY_PARAM_PUB_KEY,
                     const_cast<unsigned char*>(public_key.data()),
                     public_key.size()),
                 OSSL_PARAM_construct_end()};

  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(key_ctx.get(), &raw_pkey, EVP_PKEY_PUBLIC_KEY,
                        params.data()) != 1) {
    return std::nullopt;
  }
  return evp_pkey_ptr{raw_pkey, EVP_PKEY_free};
}

std::optional<std::vector<uint8_t>> to_der_signature(
    const multitest::schema::bytes_view_t& compact) {
  auto ecdsa_sig = ecdsa_sig_ptr{ECDSA_SIG_new(), ECDSA_SIG_free};
  if (!ecdsa_sig) {
    return std::nullopt;
  }
  auto r = bignum_ptr{BN_bin2bn(compact.data(), 32, nullptr), BN_free};
  auto s = bignum_ptr{BN_bin2bn(compact.data() + 32, 32, nullptr), BN_free};
  if (!r || !s ||
      ECDSA_SIG_set0(ecdsa_sig.get(), r.release(), s.release()) != 1) {
    return std::nullopt;
  }

  auto der_len = i2d_ECDSA_SIG(ecdsa_sig.get(), nullptr);
  if (der_len <= 0) {
    return std::nullopt;
  }
  auto der = std::vector<uint8_t>(static_cast<size_t>(der_len));
  auto* der_ptr = der.data();
  i2d_ECDSA_SIG(ecdsa_sig.get(), &der_ptr);
  return der;
}

}  // namespace

bool available() {
  static const auto available_now =
      openssl_has_ed25519() && openssl_has_secp256k1();
  return available_now;
}

common::result<bool> secp256k1_verify(
    const multitest::schema::bytes_view_t& message_hash,
    const multitest::schema::bytes_view_t& signature,
    const multitest::schema::bytes_view_t& public_key) {
  if (message_hash.size() != kMessageHashLength) {
    return common::error{"invalid message hash format"};
  }
  if (signature.size() != kCompactSignatureLength) {
    return common::error{"invalid signature format"};
  }
  if (public_key.size() != kCompressedPublicKeyLength &&
      public_key.size() != kUncompressedPublicKeyLength) {
    return common::error{"invalid public key format"};
  }

  auto pkey = make_secp256k1_key(public_key);
  if (!pkey) {
    return common::error{"invalid public key format"};
  }
  auto der = to_der_signature(signature);
  if (!der) {
    return common::error{"invalid signature format"};
  }

  // The message is already hashed, so verify against the raw digest.
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new(pkey->get(), nullptr),
                              EVP_PKEY_CTX_free};
  if (!ctx || EVP_PKEY_verify_init(ctx.get()) != 1) {
    return common::error{"secp256k1 verification is unavailable"};
  }
  return EVP_PKEY_verify(ctx.get(), der->data(), der->size(),
                         message_hash.data(), message_hash.size()) == 1;
}

common::result<bool> ed25519_verify(
    const multitest::schema::bytes_view_t& message,
    const multitest::schema::bytes_view_t& signature,
    const multitest::schema::bytes_view_t& public_key) {
  if (signature.size() != kCompactSignatureLength) {
    return common::error{"invalid signature format"};
  }
  if (public_key.size() != kEd25519PublicKeyLength) {
    return common::error{"invalid public key format"};
  }

  auto pkey = evp_pkey_ptr{
      EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, public_key.data(),
                                  public_key.size()),
      EVP_PKEY_free};
  if (!pkey) {
    return common::error{"invalid public key format"};
  }

  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx ||
      EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) !=
          1) {
    return common::error{"ed25519 verification is unavailable"};
  }
  return EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                          message.data(), message.size()) == 1;
}

}  // namespace multitest::crypto
