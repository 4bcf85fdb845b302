#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <multitest/blake3/hash.hpp>
#include <multitest/crypto/verify.hpp>
#include <multitest/host/mock_api.hpp>

#include <algorithm>
#include <cctype>
#include <utility>

using namespace multitest::schema;

namespace multitest::host {

namespace {

constexpr auto kSeparator = std::string_view{"1"};
constexpr auto kMaxCanonicalLength = size_t{64};

}  // namespace

mock_api::mock_api(std::string prefix) : prefix_{std::move(prefix)} {}

common::result<addr_t> mock_api::addr_validate(
    const std::string_view human) const {
  auto canonical = addr_canonicalize(human);
  if (!common::is_ok(canonical)) {
    return common::error_of(canonical);
  }
  auto normalized = addr_humanize(make_bytes_view(common::value(canonical)));
  if (!common::is_ok(normalized)) {
    return common::error_of(normalized);
  }
  if (common::value(normalized) != human) {
    return common::error{"Invalid input: address not normalized"};
  }
  return addr_t{human};
}

common::result<bytes_t> mock_api::addr_canonicalize(
    const std::string_view human) const {
  auto hrp = prefix_ + std::string{kSeparator};
  if (!human.starts_with(hrp)) {
    return common::error{
        fmt::format("Invalid input: address must start with '{}'", hrp)};
  }
  auto payload = human.substr(hrp.size());
  if (std::any_of(std::begin(payload), std::end(payload), [](const char c) {
        return std::isupper(static_cast<unsigned char>(c)) != 0;
      })) {
    return common::error{"Invalid input: address not normalized"};
  }
  auto canonical = try_from_hex(payload);
  if (!canonical || canonical->empty()) {
    return common::error{"Invalid input: address payload is not hex"};
  }
  if (canonical->size() > kMaxCanonicalLength) {
    return common::error{"Invalid input: address too long"};
  }
  return std::move(*canonical);
}

common::result<addr_t> mock_api::addr_humanize(
    const bytes_view_t& canonical) const {
  if (canonical.empty()) {
    return common::error{"Invalid input: canonical address is empty"};
  }
  if (canonical.size() > kMaxCanonicalLength) {
    return common::error{"Invalid input: canonical address too long"};
  }
  return prefix_ + std::string{kSeparator} + to_hex(canonical);
}

common::result<bool> mock_api::secp256k1_verify(
    const bytes_view_t& message_hash,
    const bytes_view_t& signature,
    const bytes_view_t& public_key) const {
  return multitest::crypto::secp256k1_verify(message_hash, signature,
                                             public_key);
}

common::result<bool> mock_api::ed25519_verify(
    const bytes_view_t& message,
    const bytes_view_t& signature,
    const bytes_view_t& public_key) const {
  return multitest::crypto::ed25519_verify(message, signature, public_key);
}

void mock_api::debug(const std::string_view message) const {
  spdlog::debug("contract debug: {}", message);
}

addr_t mock_api::addr_make(const std::string_view label) const {
  auto digest = multitest::blake3::hash(label);
  return prefix_ + std::string{kSeparator} +
         to_hex(bytes_view_t{digest.data(), digest.size()});
}

const std::string& mock_api::prefix() const {
  return prefix_;
}

}  // namespace multitest::host
