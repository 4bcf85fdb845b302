#include <multitest/host/mock.hpp>

#include <string>
#include <utility>

namespace multitest::host {

multitest::schema::env_t mock_env() {
  return multitest::schema::env_t{
      .block = {.height = kMockBlockHeight,
                .time = kMockBlockTime,
                .chain_id = std::string{kMockChainId}},
      .transaction = multitest::schema::transaction_info_t{.index = 3},
      .contract = {.address = std::string{kMockContractAddr}}};
}

multitest::schema::message_info_t mock_info(
    const std::string_view sender,
    std::vector<multitest::schema::coin_t> funds) {
  return multitest::schema::message_info_t{.sender = std::string{sender},
                                           .funds = std::move(funds)};
}

}  // namespace multitest::host
