#pragma once

#include <multitest/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

// Schema type: coin.
// Native token amount attached to calls (funds) and bank/staking messages.
namespace multitest::schema {

template <uint16_t Version>
struct coin;

template <>
struct coin<1> final {
  uint16_t version{1};
  std::string denom;
  amount_t amount{};

  bool operator==(const coin&) const = default;
};

using coin_t = coin<1>;

inline coin_t make_coin(const uint64_t amount, std::string denom) {
  return coin_t{.denom = std::move(denom), .amount = amount_t{amount}};
}

}  // namespace multitest::schema
