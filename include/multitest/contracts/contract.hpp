#pragma once

#include <multitest/common/error.hpp>
#include <multitest/host/deps.hpp>
#include <multitest/schema/empty.hpp>
#include <multitest/schema/env.hpp>
#include <multitest/schema/primitives.hpp>
#include <multitest/schema/reply.hpp>
#include <multitest/schema/response.hpp>

namespace multitest::contracts {

/// What a host engine sees of a contract: six byte-level entry points over a
/// message extension type C and a query extension type Q.
///
/// Implementations never keep state between calls; everything durable goes
/// through the storage lent in `deps`.
template <typename C = multitest::schema::empty_t,
          typename Q = multitest::schema::empty_t>
class contract {
 public:
  virtual ~contract() = default;

  virtual multitest::common::result<multitest::schema::response<C>> execute(
      multitest::host::deps_mut<Q> deps,
      const multitest::schema::env_t& env,
      const multitest::schema::message_info_t& info,
      const multitest::schema::bytes_view_t& msg) const = 0;

  virtual multitest::common::result<multitest::schema::response<C>>
  instantiate(multitest::host::deps_mut<Q> deps,
              const multitest::schema::env_t& env,
              const multitest::schema::message_info_t& info,
              const multitest::schema::bytes_view_t& msg) const = 0;

  virtual multitest::common::result<multitest::schema::binary_t> query(
      multitest::host::deps<Q> deps,
      const multitest::schema::env_t& env,
      const multitest::schema::bytes_view_t& msg) const = 0;

  virtual multitest::common::result<multitest::schema::response<C>> sudo(
      multitest::host::deps_mut<Q> deps,
      const multitest::schema::env_t& env,
      const multitest::schema::bytes_view_t& msg) const = 0;

  virtual multitest::common::result<multitest::schema::response<C>> reply(
      multitest::host::deps_mut<Q> deps,
      const multitest::schema::env_t& env,
      const multitest::schema::reply_t& msg) const = 0;

  virtual multitest::common::result<multitest::schema::response<C>> migrate(
      multitest::host::deps_mut<Q> deps,
      const multitest::schema::env_t& env,
      const multitest::schema::bytes_view_t& msg) const = 0;
};

}  // namespace multitest::contracts
