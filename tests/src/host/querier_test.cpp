#include <multitest/host/mock.hpp>
#include <multitest/host/querier.hpp>
#include <multitest/schema/encoding/scale/encoder.hpp>
#include <multitest/testing/common.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace {

using chain_query_t = multitest::testing::chain_query_t;

}  // namespace

TEST(querier, balance_queries_read_bank_state) {
  auto mock = multitest::host::mock_dependencies<>{};
  mock.querier().set_balance("cosmwasm1holder",
                             {multitest::schema::make_coin(5, "uatom"),
                              multitest::schema::make_coin(9, "ustake")});
  auto deps = mock.as_ref();

  auto balance = deps.querier.query_balance("cosmwasm1holder", "ustake");
  ASSERT_TRUE(multitest::common::is_ok(balance));
  EXPECT_EQ(multitest::common::value(balance),
            multitest::schema::make_coin(9, "ustake"));

  auto missing = deps.querier.query_balance("cosmwasm1nobody", "uatom");
  ASSERT_TRUE(multitest::common::is_ok(missing));
  EXPECT_EQ(multitest::common::value(missing).amount,
            multitest::schema::amount_t{0});

  auto all = deps.querier.query_all_balances("cosmwasm1holder");
  ASSERT_TRUE(multitest::common::is_ok(all));
  EXPECT_EQ(multitest::common::value(all).size(), 2u);
}

TEST(querier, validator_lookup) {
  auto mock = multitest::host::mock_dependencies<>{};
  mock.querier().add_validator(
      multitest::schema::validator_t{.address = "val1", .commission_bps = 500});
  auto deps = mock.as_ref();

  auto found = deps.querier.query_validator("val1");
  ASSERT_TRUE(multitest::common::is_ok(found));
  ASSERT_TRUE(multitest::common::value(found).has_value());
  EXPECT_EQ(multitest::common::value(found)->commission_bps, 500u);

  auto missing = deps.querier.query_validator("val2");
  ASSERT_TRUE(multitest::common::is_ok(missing));
  EXPECT_FALSE(multitest::common::value(missing).has_value());
}

TEST(querier, wasm_queries_without_handler_name_the_contract) {
  auto mock = multitest::host::mock_dependencies<>{};
  auto deps = mock.as_ref();

  auto answer = deps.querier.query_wasm_smart<uint32_t>(
      "cosmwasm1counter", multitest::schema::binary_t{});
  ASSERT_FALSE(multitest::common::is_ok(answer));
  EXPECT_EQ(multitest::common::error_of(answer).what(),
            "Querier system error: No such contract: cosmwasm1counter");
}

TEST(querier, wasm_smart_query_reaches_handler) {
  auto mock = multitest::host::mock_dependencies<>{};
  mock.querier().set_wasm_handler(
      [](const multitest::schema::wasm_query_t& query)
          -> multitest::common::result<multitest::schema::bytes_t> {
        if (!std::holds_alternative<multitest::schema::wasm_smart_query_t>(
                query)) {
          return multitest::common::error{"unexpected query"};
        }
        auto encoder = multitest::schema::encoding::scale_encoder_t{};
        return encoder.encode(uint32_t{17});
      });
  auto deps = mock.as_ref();

  auto answer = deps.querier.query_wasm_smart<uint32_t>(
      "cosmwasm1counter", multitest::schema::binary_t{});
  ASSERT_TRUE(multitest::common::is_ok(answer));
  EXPECT_EQ(multitest::common::value(answer), 17u);

  auto mistyped = deps.querier.query_wasm_smart<std::string>(
      "cosmwasm1counter", multitest::schema::binary_t{});
  ASSERT_FALSE(multitest::common::is_ok(mistyped));
  EXPECT_EQ(multitest::common::error_of(mistyped).message(),
            "Failed to parse query response");
}

TEST(querier, custom_queries_reach_custom_handler) {
  auto mock = multitest::host::mock_dependencies<chain_query_t>{};
  mock.querier().set_custom_handler(
      [](const chain_query_t& query)
          -> multitest::common::result<multitest::schema::bytes_t> {
        auto encoder = multitest::schema::encoding::scale_encoder_t{};
        return encoder.encode(query.topic + "!");
      });
  auto deps = mock.as_ref();

  auto answer = deps.querier.query<std::string>(
      multitest::schema::custom_query<chain_query_t>{
          .value = chain_query_t{.topic = "price"}});
  ASSERT_TRUE(multitest::common::is_ok(answer));
  EXPECT_EQ(multitest::common::value(answer), "price!");
}

TEST(querier, custom_queries_fail_without_handler) {
  auto mock = multitest::host::mock_dependencies<chain_query_t>{};
  auto deps = mock.as_ref();

  auto answer = deps.querier.query<std::string>(
      multitest::schema::custom_query<chain_query_t>{});
  ASSERT_FALSE(multitest::common::is_ok(answer));
  EXPECT_EQ(multitest::common::error_of(answer).what(),
            "Querier system error: Custom query handler not configured");
}

TEST(querier, malformed_request_is_reported) {
  auto mock = multitest::host::mock_dependencies<>{};
  auto garbage = multitest::schema::bytes_t{0x09};
  auto answer = mock.querier().raw_query(
      multitest::schema::make_bytes_view(garbage));
  ASSERT_FALSE(multitest::common::is_ok(answer));
  EXPECT_EQ(multitest::common::error_of(answer).message(),
            "Parsing query request");
}

TEST(querier, bonded_denom_and_validator_set) {
  auto mock = multitest::host::mock_dependencies<>{};
  auto deps = mock.as_ref();

  auto denom = deps.querier.query_bonded_denom();
  ASSERT_TRUE(multitest::common::is_ok(denom));
  EXPECT_EQ(multitest::common::value(denom), "stake");

  mock.querier().set_bonded_denom("uatom");
  mock.querier().add_validator(
      multitest::schema::validator_t{.address = "val1", .commission_bps = 500});
  mock.querier().add_validator(
      multitest::schema::validator_t{.address = "val2", .commission_bps = 700});

  denom = deps.querier.query_bonded_denom();
  ASSERT_TRUE(multitest::common::is_ok(denom));
  EXPECT_EQ(multitest::common::value(denom), "uatom");

  auto validators = deps.querier.query_all_validators();
  ASSERT_TRUE(multitest::common::is_ok(validators));
  ASSERT_EQ(multitest::common::value(validators).size(), 2u);
  EXPECT_EQ(multitest::common::value(validators)[1].address, "val2");
}

TEST(querier, delegations_are_filtered_by_delegator) {
  auto mock = multitest::host::mock_dependencies<>{};
  auto alice = multitest::schema::delegation_t{
      .delegator = "cosmwasm1alice",
      .validator = "val1",
      .amount = multitest::schema::make_coin(100, "stake")};
  auto bob = multitest::schema::delegation_t{
      .delegator = "cosmwasm1bob",
      .validator = "val1",
      .amount = multitest::schema::make_coin(40, "stake")};
  mock.querier().add_delegation(alice);
  mock.querier().add_delegation(bob);
  auto deps = mock.as_ref();

  auto found = deps.querier.query_all_delegations("cosmwasm1alice");
  ASSERT_TRUE(multitest::common::is_ok(found));
  ASSERT_EQ(multitest::common::value(found).size(), 1u);
  EXPECT_EQ(multitest::common::value(found)[0], alice);

  auto none = deps.querier.query_all_delegations("cosmwasm1carol");
  ASSERT_TRUE(multitest::common::is_ok(none));
  EXPECT_TRUE(multitest::common::value(none).empty());
}

TEST(querier, contract_info_reaches_wasm_handler) {
  auto mock = multitest::host::mock_dependencies<>{};
  mock.querier().set_wasm_handler(
      [](const multitest::schema::wasm_query_t& query)
          -> multitest::common::result<multitest::schema::bytes_t> {
        const auto* info =
            std::get_if<multitest::schema::wasm_contract_info_query_t>(&query);
        if (info == nullptr) {
          return multitest::common::error{"unexpected query"};
        }
        auto encoder = multitest::schema::encoding::scale_encoder_t{};
        return encoder.encode(multitest::schema::contract_info_response_t{
            .code_id = 3,
            .creator = "cosmwasm1creator",
            .admin = info->contract_addr});
      });
  auto deps = mock.as_ref();

  auto answer = deps.querier.query_wasm_contract_info("cosmwasm1counter");
  ASSERT_TRUE(multitest::common::is_ok(answer));
  EXPECT_EQ(multitest::common::value(answer).code_id, 3u);
  EXPECT_EQ(multitest::common::value(answer).creator, "cosmwasm1creator");
  EXPECT_EQ(multitest::common::value(answer).admin,
            std::optional<std::string>{"cosmwasm1counter"});
}
