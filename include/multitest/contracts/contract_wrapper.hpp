#pragma once

#include <multitest/common/error.hpp>
#include <multitest/contracts/casting.hpp>
#include <multitest/contracts/contract.hpp>
#include <multitest/contracts/entry_points.hpp>
#include <multitest/schema/empty.hpp>
#include <spdlog/spdlog.h>
#include <memory>
#include <utility>

namespace multitest::contracts {

namespace detail {

template <typename T>
multitest::common::result<T> log_outcome(const entry_point_kind kind,
                                         multitest::common::result<T> outcome) {
  if (!multitest::common::is_ok(outcome)) {
    spdlog::debug("{} failed: {}", to_string(kind),
                  multitest::common::error_of(outcome).what());
  }
  return outcome;
}

}  // namespace detail

/// Contract assembled from one handler per entry point kind.
///
/// execute, instantiate and query are required. sudo, reply and migrate start
/// out as handlers that always fail and can be replaced with the `with_*`
/// builders, either by handlers written against (Q, C) or by baseline
/// handlers which are cast on the way in.
template <typename C = multitest::schema::empty_t,
          typename Q = multitest::schema::empty_t>
class contract_wrapper final : public contract<C, Q> {
 public:
  using execute_handler_t = handler<entry_point_kind::execute, Q, C>;
  using instantiate_handler_t = handler<entry_point_kind::instantiate, Q, C>;
  using query_handler_t = handler<entry_point_kind::query, Q>;
  using sudo_handler_t = handler<entry_point_kind::sudo, Q, C>;
  using reply_handler_t = handler<entry_point_kind::reply, Q, C>;
  using migrate_handler_t = handler<entry_point_kind::migrate, Q, C>;

  using empty_sudo_handler_t = handler<entry_point_kind::sudo>;
  using empty_reply_handler_t = handler<entry_point_kind::reply>;
  using empty_migrate_handler_t = handler<entry_point_kind::migrate>;

  contract_wrapper(execute_handler_t execute,
                   instantiate_handler_t instantiate,
                   query_handler_t query)
      : execute_{std::move(execute)},
        instantiate_{std::move(instantiate)},
        query_{std::move(query)},
        sudo_{default_sudo_handler<Q, C>()},
        reply_{default_reply_handler<Q, C>()},
        migrate_{default_migrate_handler<Q, C>()} {}

  contract_wrapper& with_sudo(sudo_handler_t sudo) & {
    sudo_ = std::move(sudo);
    return *this;
  }

  contract_wrapper&& with_sudo(sudo_handler_t sudo) && {
    sudo_ = std::move(sudo);
    return std::move(*this);
  }

  contract_wrapper& with_sudo_empty(empty_sudo_handler_t sudo) & {
    return with_sudo(cast<Q, C>(std::move(sudo)));
  }

  contract_wrapper&& with_sudo_empty(empty_sudo_handler_t sudo) && {
    return std::move(*this).with_sudo(cast<Q, C>(std::move(sudo)));
  }

  contract_wrapper& with_reply(reply_handler_t reply) & {
    reply_ = std::move(reply);
    return *this;
  }

  contract_wrapper&& with_reply(reply_handler_t reply) && {
    reply_ = std::move(reply);
    return std::move(*this);
  }

  contract_wrapper& with_reply_empty(empty_reply_handler_t reply) & {
    return with_reply(cast<Q, C>(std::move(reply)));
  }

  contract_wrapper&& with_reply_empty(empty_reply_handler_t reply) && {
    return std::move(*this).with_reply(cast<Q, C>(std::move(reply)));
  }

  contract_wrapper& with_migrate(migrate_handler_t migrate) & {
    migrate_ = std::move(migrate);
    return *this;
  }

  contract_wrapper&& with_migrate(migrate_handler_t migrate) && {
    migrate_ = std::move(migrate);
    return std::move(*this);
  }

  contract_wrapper& with_migrate_empty(empty_migrate_handler_t migrate) & {
    return with_migrate(cast<Q, C>(std::move(migrate)));
  }

  contract_wrapper&& with_migrate_empty(empty_migrate_handler_t migrate) && {
    return std::move(*this).with_migrate(cast<Q, C>(std::move(migrate)));
  }

  /// Hand the wrapper over in the form the host engine stores contracts.
  std::unique_ptr<contract<C, Q>> box() && {
    return std::make_unique<contract_wrapper>(std::move(*this));
  }

  multitest::common::result<multitest::schema::response<C>> execute(
      multitest::host::deps_mut<Q> deps,
      const multitest::schema::env_t& env,
      const multitest::schema::message_info_t& info,
      const multitest::schema::bytes_view_t& msg) const override {
    spdlog::debug("execute {} from {}", env.contract.address, info.sender);
    return detail::log_outcome(entry_point_kind::execute,
                               execute_.call(deps, env, info, msg));
  }

  multitest::common::result<multitest::schema::response<C>> instantiate(
      multitest::host::deps_mut<Q> deps,
      const multitest::schema::env_t& env,
      const multitest::schema::message_info_t& info,
      const multitest::schema::bytes_view_t& msg) const override {
    spdlog::debug("instantiate {} from {}", env.contract.address,
                  info.sender);
    return detail::log_outcome(entry_point_kind::instantiate,
                               instantiate_.call(deps, env, info, msg));
  }

  multitest::common::result<multitest::schema::binary_t> query(
      multitest::host::deps<Q> deps,
      const multitest::schema::env_t& env,
      const multitest::schema::bytes_view_t& msg) const override {
    spdlog::debug("query {}", env.contract.address);
    return detail::log_outcome(entry_point_kind::query,
                               query_.call(deps, env, msg));
  }

  multitest::common::result<multitest::schema::response<C>> sudo(
      multitest::host::deps_mut<Q> deps,
      const multitest::schema::env_t& env,
      const multitest::schema::bytes_view_t& msg) const override {
    spdlog::debug("sudo {}", env.contract.address);
    return detail::log_outcome(entry_point_kind::sudo,
                               sudo_.call(deps, env, msg));
  }

  multitest::common::result<multitest::schema::response<C>> reply(
      multitest::host::deps_mut<Q> deps,
      const multitest::schema::env_t& env,
      const multitest::schema::reply_t& msg) const override {
    spdlog::debug("reply {} for sub-message {}", env.contract.address, msg.id);
    return detail::log_outcome(entry_point_kind::reply,
                               reply_.call(deps, env, msg));
  }

  multitest::common::result<multitest::schema::response<C>> migrate(
      multitest::host::deps_mut<Q> deps,
      const multitest::schema::env_t& env,
      const multitest::schema::bytes_view_t& msg) const override {
    spdlog::debug("migrate {}", env.contract.address);
    return detail::log_outcome(entry_point_kind::migrate,
                               migrate_.call(deps, env, msg));
  }

 private:
  execute_handler_t execute_;
  instantiate_handler_t instantiate_;
  query_handler_t query_;
  sudo_handler_t sudo_;
  reply_handler_t reply_;
  migrate_handler_t migrate_;
};

/// Build a (C, Q) contract from handlers that only know the baseline types.
template <typename C = multitest::schema::empty_t,
          typename Q = multitest::schema::empty_t>
contract_wrapper<C, Q> make_contract_wrapper_with_empty(
    handler<entry_point_kind::execute> execute,
    handler<entry_point_kind::instantiate> instantiate,
    handler<entry_point_kind::query> query) {
  return contract_wrapper<C, Q>{cast<Q, C>(std::move(execute)),
                                cast<Q, C>(std::move(instantiate)),
                                cast<Q, C>(std::move(query))};
}

}  // namespace multitest::contracts
