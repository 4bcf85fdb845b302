#include <multitest/contracts/context.hpp>
#include <multitest/host/mock.hpp>
#include <multitest/schema/coin.hpp>
#include <multitest/testing/common.hpp>
#include <multitest/testing/counter_contract.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <variant>

namespace {

using chain_msg_t = multitest::testing::chain_msg_t;
using chain_query_t = multitest::testing::chain_query_t;

multitest::schema::response<> make_response_with(
    multitest::schema::cosmos_msg<> msg) {
  auto response = multitest::schema::response<>{};
  response.add_message(std::move(msg));
  return response;
}

}  // namespace

TEST(context, widening_preserves_events_attributes_and_data) {
  auto baseline = multitest::testing::make_mixed_response();
  auto widened =
      multitest::contracts::customize_response<chain_msg_t>(baseline);

  EXPECT_EQ(widened.attributes, baseline.attributes);
  EXPECT_EQ(widened.events, baseline.events);
  EXPECT_EQ(widened.data, baseline.data);
  ASSERT_EQ(widened.messages.size(), baseline.messages.size());

  auto projected = multitest::testing::project_response(widened);
  ASSERT_TRUE(projected.has_value());
  EXPECT_EQ(*projected, baseline);
}

TEST(context, widening_to_baseline_is_identity) {
  auto baseline = multitest::testing::make_mixed_response();
  auto widened = multitest::contracts::customize_response<
      multitest::schema::empty_t>(baseline);
  EXPECT_EQ(widened, baseline);
}

TEST(context, widening_keeps_sub_message_envelope) {
  auto sub = multitest::schema::make_sub_msg<>(
      42,
      multitest::schema::cosmos_msg<>{
          multitest::schema::bank_msg_t{multitest::schema::bank_burn_t{
              .amount = {multitest::schema::make_coin(3, "uatom")}}}},
      multitest::schema::reply_on_t::error, 80'000);

  auto widened = multitest::contracts::customize_sub_msg<chain_msg_t>(sub);
  EXPECT_EQ(widened.id, 42u);
  EXPECT_EQ(widened.reply_on, multitest::schema::reply_on_t::error);
  ASSERT_TRUE(widened.gas_limit.has_value());
  EXPECT_EQ(*widened.gas_limit, 80'000u);
  ASSERT_TRUE(
      std::holds_alternative<multitest::schema::bank_msg_t>(widened.msg));
  EXPECT_EQ(std::get<multitest::schema::bank_msg_t>(widened.msg),
            std::get<multitest::schema::bank_msg_t>(sub.msg));
}

TEST(context, widening_keeps_message_order) {
  auto baseline = multitest::testing::make_mixed_response();
  auto widened =
      multitest::contracts::customize_response<chain_msg_t>(baseline);
  ASSERT_EQ(widened.messages.size(), 4u);
  EXPECT_TRUE(std::holds_alternative<multitest::schema::bank_msg_t>(
      widened.messages[0].msg));
  EXPECT_TRUE(std::holds_alternative<multitest::schema::staking_msg_t>(
      widened.messages[1].msg));
  EXPECT_TRUE(std::holds_alternative<multitest::schema::distribution_msg_t>(
      widened.messages[2].msg));
  EXPECT_TRUE(std::holds_alternative<multitest::schema::wasm_msg_t>(
      widened.messages[3].msg));
  EXPECT_EQ(widened.messages[1].id, 7u);
  EXPECT_EQ(widened.messages[3].id, 9u);
}

TEST(context, empty_response_widens_to_empty_response) {
  auto widened = multitest::contracts::customize_response<chain_msg_t>(
      multitest::schema::response<>{});
  EXPECT_TRUE(widened.messages.empty());
  EXPECT_TRUE(widened.attributes.empty());
  EXPECT_TRUE(widened.events.empty());
  EXPECT_FALSE(widened.data.has_value());
}

#if MULTITEST_STARGATE
TEST(context, stargate_and_ibc_pass_through) {
  auto baseline = make_response_with(
      multitest::schema::stargate_msg_t{.type_url = "/cosmos.bank.v1beta1.MsgSend",
                                        .value = {0x0A, 0x0B}});
  baseline.add_message(multitest::schema::ibc_msg_t{
      multitest::schema::ibc_close_channel_t{.channel_id = "channel-0"}});

  auto widened =
      multitest::contracts::customize_response<chain_msg_t>(baseline);
  auto projected = multitest::testing::project_response(widened);
  ASSERT_TRUE(projected.has_value());
  EXPECT_EQ(*projected, baseline);
}
#else
TEST(context_death, stargate_is_unknown_without_cross_chain_support) {
  auto baseline = make_response_with(multitest::schema::stargate_msg_t{
      .type_url = "/cosmos.bank.v1beta1.MsgSend", .value = {}});
  EXPECT_DEATH(
      {
        multitest::testing::log_to_stderr();
        multitest::contracts::customize_response<chain_msg_t>(baseline);
      },
      "unknown message variant");
}
#endif

TEST(context_death, gov_message_is_unknown_variant) {
  auto baseline = make_response_with(multitest::schema::gov_msg_t{
      multitest::schema::gov_vote_t{.proposal_id = 1}});
  EXPECT_DEATH(
      {
        multitest::testing::log_to_stderr();
        multitest::contracts::customize_response<chain_msg_t>(baseline);
      },
      "unknown message variant");
}

TEST(context_death, custom_message_under_baseline_is_fatal) {
  auto baseline = make_response_with(
      multitest::schema::custom_msg<multitest::schema::empty_t>{});
  EXPECT_DEATH(
      {
        multitest::testing::log_to_stderr();
        multitest::contracts::customize_response<chain_msg_t>(baseline);
      },
      "custom message variant");
}

TEST(context, narrowed_mutable_context_shares_storage) {
  auto mock = multitest::host::mock_dependencies<chain_query_t>{};
  auto deps = mock.as_mut();
  auto narrowed = multitest::contracts::customize_deps(deps);

  multitest::testing::save_count(narrowed.storage, 11);
  EXPECT_EQ(multitest::testing::load_count(mock.storage()), 11u);
  EXPECT_EQ(&narrowed.api, &deps.api);
  EXPECT_EQ(&narrowed.querier.inner(), &deps.querier.inner());
}

TEST(context, narrowed_context_answers_baseline_queries) {
  auto mock = multitest::host::mock_dependencies<chain_query_t>{};
  mock.querier().set_balance(
      "cosmwasm1holder", {multitest::schema::make_coin(77, "uatom")});

  auto deps = mock.as_ref();
  auto narrowed = multitest::contracts::customize_deps(deps);
  auto balance = narrowed.querier.query_balance("cosmwasm1holder", "uatom");
  ASSERT_TRUE(multitest::common::is_ok(balance));
  EXPECT_EQ(multitest::common::value(balance).amount,
            multitest::schema::amount_t{77});
}

TEST(context, narrowed_context_refuses_custom_queries) {
  auto mock = multitest::host::mock_dependencies<chain_query_t>{};
  auto deps = mock.as_ref();
  auto narrowed = multitest::contracts::customize_deps(deps);

  auto answer = narrowed.querier.query<multitest::schema::bytes_t>(
      multitest::schema::custom_query<multitest::schema::empty_t>{});
  ASSERT_FALSE(multitest::common::is_ok(answer));
  EXPECT_EQ(multitest::common::error_of(answer).what(),
            "custom queries are not supported by this querier");
}
