#pragma once

#include <multitest/schema/cosmos_msg.hpp>
#include <multitest/schema/empty.hpp>
#include <multitest/schema/primitives.hpp>
#include <multitest/schema/response.hpp>
#include <multitest/schema/sub_msg.hpp>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace multitest::testing {

/// Chain-specific message extension used to instantiate contracts with a
/// non-baseline message type.
struct chain_msg_t final {
  std::string action;
  uint64_t amount{};

  bool operator==(const chain_msg_t&) const = default;
};

/// Chain-specific query extension.
struct chain_query_t final {
  std::string topic;

  bool operator==(const chain_query_t&) const = default;
};

/// Second extension pair, to check that one baseline handler serves several
/// chains.
struct other_msg_t final {
  uint32_t code{};

  bool operator==(const other_msg_t&) const = default;
};

struct other_query_t final {
  uint32_t code{};

  bool operator==(const other_query_t&) const = default;
};

/// Route the default logger to stderr so death tests can match on critical
/// messages.
inline void log_to_stderr() {
  auto logger = std::make_shared<spdlog::logger>(
      "multitest_stderr", std::make_shared<spdlog::sinks::stderr_sink_mt>());
  spdlog::set_default_logger(std::move(logger));
}

/// Map a widened message back onto the baseline type. Custom messages have no
/// baseline form.
template <typename C>
std::optional<multitest::schema::cosmos_msg<>> project_msg(
    const multitest::schema::cosmos_msg<C>& msg) {
  return std::visit(
      [](const auto& value) -> std::optional<multitest::schema::cosmos_msg<>> {
        using value_t = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<value_t,
                                     multitest::schema::custom_msg<C>>) {
          return std::nullopt;
        } else {
          return multitest::schema::cosmos_msg<>{std::in_place_type<value_t>,
                                                 value};
        }
      },
      msg);
}

template <typename C>
std::optional<multitest::schema::response<>> project_response(
    const multitest::schema::response<C>& response) {
  auto projected = multitest::schema::response<>{};
  for (const auto& sub : response.messages) {
    auto msg = project_msg(sub.msg);
    if (!msg) {
      return std::nullopt;
    }
    projected.messages.push_back(
        multitest::schema::sub_msg<>{.id = sub.id,
                                     .msg = std::move(*msg),
                                     .gas_limit = sub.gas_limit,
                                     .reply_on = sub.reply_on});
  }
  projected.attributes = response.attributes;
  projected.events = response.events;
  projected.data = response.data;
  return projected;
}

}  // namespace multitest::testing
