#pragma once

#include <multitest/host/deps.hpp>
#include <multitest/host/mock_api.hpp>
#include <multitest/host/mock_querier.hpp>
#include <multitest/schema/coin.hpp>
#include <multitest/schema/empty.hpp>
#include <multitest/schema/env.hpp>
#include <multitest/storage/memory/storage.hpp>
#include <string_view>
#include <vector>

namespace multitest::host {

inline constexpr auto kMockContractAddr = std::string_view{"cosmos2contract"};
inline constexpr auto kMockChainId = std::string_view{"cosmos-testnet-14002"};
inline constexpr auto kMockBlockHeight = uint64_t{12'345};
inline constexpr auto kMockBlockTime =
    multitest::schema::timestamp_nanoseconds_t{1'571'797'419'879'305'533};

/// Owns a complete set of collaborators and lends them out as request
/// contexts, standing in for the host engine in unit tests.
template <typename Q = multitest::schema::empty_t>
class mock_dependencies final {
 public:
  mock_dependencies() = default;

  mock_dependencies(const mock_dependencies&) = delete;
  mock_dependencies& operator=(const mock_dependencies&) = delete;
  mock_dependencies(mock_dependencies&&) = delete;
  mock_dependencies& operator=(mock_dependencies&&) = delete;

  multitest::storage::memory_storage_t& storage() { return storage_; }
  const multitest::storage::memory_storage_t& storage() const {
    return storage_;
  }

  mock_api& api() { return api_; }
  const mock_api& api() const { return api_; }

  mock_querier<Q>& querier() { return querier_; }
  const mock_querier<Q>& querier() const { return querier_; }

  deps<Q> as_ref() const {
    return deps<Q>{storage_, api_, querier_wrapper<Q>{querier_}};
  }

  deps_mut<Q> as_mut() {
    return deps_mut<Q>{storage_, api_, querier_wrapper<Q>{querier_}};
  }

 private:
  multitest::storage::memory_storage_t storage_;
  mock_api api_;
  mock_querier<Q> querier_;
};

/// Env for block 12345 on the mock chain, calling `cosmos2contract`.
multitest::schema::env_t mock_env();

multitest::schema::message_info_t mock_info(
    std::string_view sender,
    std::vector<multitest::schema::coin_t> funds = {});

}  // namespace multitest::host
