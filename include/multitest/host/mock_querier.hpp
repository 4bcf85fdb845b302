#pragma once

#include <spdlog/fmt/fmt.h>
#include <multitest/common/error.hpp>
#include <multitest/host/querier.hpp>
#include <multitest/schema/coin.hpp>
#include <multitest/schema/empty.hpp>
#include <multitest/schema/encoding/scale/encoder.hpp>
#include <multitest/schema/query_request.hpp>
#include <algorithm>
#include <functional>
#include <iterator>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace multitest::host {

/// In-memory query dispatcher for tests.
///
/// Answers bank and staking queries from local state (the bonded denom
/// defaults to "stake") and forwards wasm and custom queries to pluggable
/// handlers. Requests are decoded as `query_request<Q>`; a baseline-typed
/// request for any non-custom alternative decodes the same way.
template <typename Q = multitest::schema::empty_t>
class mock_querier final : public querier {
 public:
  using wasm_handler_t = std::function<common::result<multitest::schema::bytes_t>(
      const multitest::schema::wasm_query_t&)>;
  using custom_handler_t =
      std::function<common::result<multitest::schema::bytes_t>(const Q&)>;

  mock_querier()
      : wasm_handler_{[](const multitest::schema::wasm_query_t& query) {
          const auto& address = std::visit(
              [](const auto& value) -> const std::string& {
                return value.contract_addr;
              },
              query);
          return common::result<multitest::schema::bytes_t>{
              common::error{fmt::format("No such contract: {}", address)}};
        }},
        custom_handler_{[](const Q&) {
          return common::result<multitest::schema::bytes_t>{
              common::error{"Custom query handler not configured"}};
        }} {}

  common::result<multitest::schema::bytes_t> raw_query(
      const multitest::schema::bytes_view_t& request) const override {
    auto encoder = multitest::schema::encoding::scale_encoder_t{};
    auto reason = std::string{};
    auto decoded =
        encoder.try_decode<multitest::schema::query_request<Q>>(request, reason);
    if (!decoded) {
      return common::error{std::move(reason)}.context(
          "Parsing query request");
    }

    return std::visit(
        overloaded{
            [&](const multitest::schema::bank_query_t& query) {
              return answer_bank(encoder, query);
            },
            [&](const multitest::schema::custom_query<Q>& query) {
              return custom_handler_(query.value);
            },
            [&](const multitest::schema::staking_query_t& query) {
              return answer_staking(encoder, query);
            },
            [&](const multitest::schema::wasm_query_t& query) {
              return wasm_handler_(query);
            }},
        *decoded);
  }

  void set_balance(const multitest::schema::addr_t& address,
                   std::vector<multitest::schema::coin_t> balance) {
    balances_.insert_or_assign(address, std::move(balance));
  }

  void set_bonded_denom(std::string denom) { bonded_denom_ = std::move(denom); }

  void add_validator(multitest::schema::validator_t validator) {
    validators_.push_back(std::move(validator));
  }

  void add_delegation(multitest::schema::delegation_t delegation) {
    delegations_.push_back(std::move(delegation));
  }

  void set_wasm_handler(wasm_handler_t handler) {
    wasm_handler_ = std::move(handler);
  }

  void set_custom_handler(custom_handler_t handler) {
    custom_handler_ = std::move(handler);
  }

 private:
  common::result<multitest::schema::bytes_t> answer_bank(
      multitest::schema::encoding::scale_encoder_t& encoder,
      const multitest::schema::bank_query_t& query) const {
    return std::visit(
        overloaded{
            [&](const multitest::schema::bank_balance_query_t& value)
                -> common::result<multitest::schema::bytes_t> {
              auto found = multitest::schema::coin_t{.denom = value.denom};
              auto it = balances_.find(value.address);
              if (it != std::end(balances_)) {
                auto coin = std::find_if(
                    std::begin(it->second), std::end(it->second),
                    [&](const auto& c) { return c.denom == value.denom; });
                if (coin != std::end(it->second)) {
                  found = *coin;
                }
              }
              return encoder.encode(found);
            },
            [&](const multitest::schema::bank_all_balances_query_t& value)
                -> common::result<multitest::schema::bytes_t> {
              auto it = balances_.find(value.address);
              if (it == std::end(balances_)) {
                return encoder.encode(
                    std::vector<multitest::schema::coin_t>{});
              }
              return encoder.encode(it->second);
            }},
        query);
  }

  common::result<multitest::schema::bytes_t> answer_staking(
      multitest::schema::encoding::scale_encoder_t& encoder,
      const multitest::schema::staking_query_t& query) const {
    return std::visit(
        overloaded{
            [&](const multitest::schema::staking_bonded_denom_query_t&)
                -> common::result<multitest::schema::bytes_t> {
              return encoder.encode(bonded_denom_);
            },
            [&](const multitest::schema::staking_all_validators_query_t&)
                -> common::result<multitest::schema::bytes_t> {
              return encoder.encode(validators_);
            },
            [&](const multitest::schema::staking_validator_query_t& value)
                -> common::result<multitest::schema::bytes_t> {
              auto found = std::optional<multitest::schema::validator_t>{};
              auto it = std::find_if(
                  std::begin(validators_), std::end(validators_),
                  [&](const auto& v) { return v.address == value.address; });
              if (it != std::end(validators_)) {
                found = *it;
              }
              return encoder.encode(found);
            },
            [&](const multitest::schema::staking_all_delegations_query_t& value)
                -> common::result<multitest::schema::bytes_t> {
              auto matching = std::vector<multitest::schema::delegation_t>{};
              std::copy_if(
                  std::begin(delegations_), std::end(delegations_),
                  std::back_inserter(matching),
                  [&](const auto& d) { return d.delegator == value.delegator; });
              return encoder.encode(matching);
            }},
        query);
  }

  std::map<multitest::schema::addr_t, std::vector<multitest::schema::coin_t>>
      balances_;
  std::string bonded_denom_{"stake"};
  std::vector<multitest::schema::validator_t> validators_;
  std::vector<multitest::schema::delegation_t> delegations_;
  wasm_handler_t wasm_handler_;
  custom_handler_t custom_handler_;
};

}  // namespace multitest::host
