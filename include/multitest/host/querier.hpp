#pragma once

#include <multitest/common/error.hpp>
#include <multitest/schema/coin.hpp>
#include <multitest/schema/empty.hpp>
#include <multitest/schema/encoding/scale/encoder.hpp>
#include <multitest/schema/primitives.hpp>
#include <multitest/schema/query_request.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace multitest::host {

/// Query dispatcher provided by the host engine.
///
/// Receives a SCALE encoded `query_request<Q>` and answers with the encoded
/// response. The dispatcher is untyped; typing happens in `querier_wrapper`.
class querier {
 public:
  virtual ~querier() = default;

  virtual common::result<multitest::schema::bytes_t> raw_query(
      const multitest::schema::bytes_view_t& request) const = 0;
};

/// Typed, non-owning view of a querier for custom query type `Q`.
///
/// Wrapping the same querier with `empty_t` narrows it to the baseline query
/// surface: custom queries are refused before they reach the dispatcher.
template <typename Q = multitest::schema::empty_t>
class querier_wrapper final {
 public:
  explicit querier_wrapper(const querier& inner) : inner_{&inner} {}

  const querier& inner() const { return *inner_; }

  template <typename T>
  common::result<T> query(
      const multitest::schema::query_request<Q>& request) const;

  common::result<multitest::schema::coin_t> query_balance(
      std::string_view address,
      std::string_view denom) const {
    return query<multitest::schema::coin_t>(
        multitest::schema::bank_query_t{multitest::schema::bank_balance_query_t{
            .address = std::string{address}, .denom = std::string{denom}}});
  }

  common::result<std::vector<multitest::schema::coin_t>> query_all_balances(
      std::string_view address) const {
    return query<std::vector<multitest::schema::coin_t>>(
        multitest::schema::bank_query_t{
            multitest::schema::bank_all_balances_query_t{
                .address = std::string{address}}});
  }

  common::result<std::string> query_bonded_denom() const {
    return query<std::string>(multitest::schema::staking_query_t{
        multitest::schema::staking_bonded_denom_query_t{}});
  }

  common::result<std::vector<multitest::schema::validator_t>>
  query_all_validators() const {
    return query<std::vector<multitest::schema::validator_t>>(
        multitest::schema::staking_query_t{
            multitest::schema::staking_all_validators_query_t{}});
  }

  common::result<std::optional<multitest::schema::validator_t>> query_validator(
      std::string_view address) const {
    return query<std::optional<multitest::schema::validator_t>>(
        multitest::schema::staking_query_t{
            multitest::schema::staking_validator_query_t{
                .address = std::string{address}}});
  }

  common::result<std::vector<multitest::schema::delegation_t>>
  query_all_delegations(std::string_view delegator) const {
    return query<std::vector<multitest::schema::delegation_t>>(
        multitest::schema::staking_query_t{
            multitest::schema::staking_all_delegations_query_t{
                .delegator = std::string{delegator}}});
  }

  /// Run a smart query against another contract and decode its answer as T.
  template <typename T>
  common::result<T> query_wasm_smart(std::string_view contract_addr,
                                     multitest::schema::binary_t msg) const {
    return query<T>(
        multitest::schema::wasm_query_t{multitest::schema::wasm_smart_query_t{
            .contract_addr = std::string{contract_addr},
            .msg = std::move(msg)}});
  }

  common::result<std::optional<multitest::schema::bytes_t>> query_wasm_raw(
      std::string_view contract_addr,
      multitest::schema::bytes_t key) const {
    return query<std::optional<multitest::schema::bytes_t>>(
        multitest::schema::wasm_query_t{multitest::schema::wasm_raw_query_t{
            .contract_addr = std::string{contract_addr},
            .key = std::move(key)}});
  }

  common::result<multitest::schema::contract_info_response_t>
  query_wasm_contract_info(std::string_view contract_addr) const {
    return query<multitest::schema::contract_info_response_t>(
        multitest::schema::wasm_query_t{
            multitest::schema::wasm_contract_info_query_t{
                .contract_addr = std::string{contract_addr}}});
  }

 private:
  const querier* inner_;
};

template <typename Q>
template <typename T>
common::result<T> querier_wrapper<Q>::query(
    const multitest::schema::query_request<Q>& request) const {
  if constexpr (std::is_same_v<Q, multitest::schema::empty_t>) {
    if (std::holds_alternative<multitest::schema::custom_query<Q>>(request)) {
      return common::error{"custom queries are not supported by this querier"};
    }
  }

  auto encoder = multitest::schema::encoding::scale_encoder_t{};
  auto encoded = encoder.encode(request);
  auto raw = inner_->raw_query(
      multitest::schema::bytes_view_t{encoded.data(), encoded.size()});
  if (!common::is_ok(raw)) {
    return common::error_of(raw).context("Querier system error");
  }

  const auto& answer = common::value(raw);
  auto reason = std::string{};
  auto decoded = encoder.try_decode<T>(
      multitest::schema::bytes_view_t{answer.data(), answer.size()}, reason);
  if (!decoded) {
    return common::error{std::move(reason)}.context(
        "Failed to parse query response");
  }
  return std::move(*decoded);
}

}  // namespace multitest::host
