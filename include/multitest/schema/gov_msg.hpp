#pragma once

#include <cstdint>
#include <variant>

// Schema type: gov message.
// Governance votes cast by the contract account.
namespace multitest::schema {

enum class vote_option_t : uint8_t {
  yes = 0,
  no = 1,
  abstain = 2,
  no_with_veto = 3
};

struct gov_vote_t final {
  uint64_t proposal_id{};
  vote_option_t vote{vote_option_t::abstain};

  bool operator==(const gov_vote_t&) const = default;
};

using gov_msg_t = std::variant<gov_vote_t>;

}  // namespace multitest::schema
