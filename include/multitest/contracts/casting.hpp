#pragma once

#include <multitest/contracts/context.hpp>
#include <multitest/contracts/entry_points.hpp>
#include <multitest/schema/empty.hpp>
#include <utility>

// Adapters that let a handler written against the baseline extension types
// serve a contract bound to chain-specific ones. The wrapped handler is
// called exactly once per invocation and its errors pass through unchanged.
namespace multitest::contracts {

namespace detail {

/// Rebuild `inner` as a handler of `Kind` over (NewQ, NewC), converting the
/// request context with `map_deps` on the way in and the success value with
/// `map_output` on the way out.
template <entry_point_kind Kind,
          typename NewQ,
          typename NewC,
          typename Inner,
          typename MapDeps,
          typename MapOutput>
handler<Kind, NewQ, NewC> adapt(Inner inner,
                                MapDeps map_deps,
                                MapOutput map_output) {
  using traits_t = entry_point_traits<Kind, NewQ, NewC>;
  using deps_t = typename traits_t::deps_t;
  using output_t = typename traits_t::output_t;

  if constexpr (traits_t::kTakesSender) {
    return handler<Kind, NewQ, NewC>{
        [inner = std::move(inner), map_deps, map_output](
            deps_t deps, const multitest::schema::env_t& env,
            const multitest::schema::message_info_t& info,
            const multitest::schema::bytes_view_t& msg)
            -> multitest::common::result<output_t> {
          auto outcome = inner.call(map_deps(deps), env, info, msg);
          if (!multitest::common::is_ok(outcome)) {
            return multitest::common::error_of(outcome);
          }
          return map_output(std::move(multitest::common::value(outcome)));
        }};
  } else if constexpr (traits_t::kDecodesPayload) {
    return handler<Kind, NewQ, NewC>{
        [inner = std::move(inner), map_deps, map_output](
            deps_t deps, const multitest::schema::env_t& env,
            const multitest::schema::bytes_view_t& msg)
            -> multitest::common::result<output_t> {
          auto outcome = inner.call(map_deps(deps), env, msg);
          if (!multitest::common::is_ok(outcome)) {
            return multitest::common::error_of(outcome);
          }
          return map_output(std::move(multitest::common::value(outcome)));
        }};
  } else {
    return handler<Kind, NewQ, NewC>{
        [inner = std::move(inner), map_deps, map_output](
            deps_t deps, const multitest::schema::env_t& env,
            const multitest::schema::reply_t& reply)
            -> multitest::common::result<output_t> {
          auto outcome = inner.call(map_deps(deps), env, reply);
          if (!multitest::common::is_ok(outcome)) {
            return multitest::common::error_of(outcome);
          }
          return map_output(std::move(multitest::common::value(outcome)));
        }};
  }
}

struct keep_deps final {
  template <typename Deps>
  Deps operator()(Deps& deps) const {
    return deps;
  }
};

struct narrow_deps final {
  template <typename Deps>
  auto operator()(Deps& deps) const {
    return customize_deps(deps);
  }
};

struct keep_output final {
  template <typename T>
  T operator()(T&& value) const {
    return std::forward<T>(value);
  }
};

template <typename C>
struct widen_response final {
  multitest::schema::response<C> operator()(
      multitest::schema::response<multitest::schema::empty_t>&& response)
      const {
    return customize_response<C>(std::move(response));
  }
};

}  // namespace detail

/// Serve requests whose context carries query type NewQ with a handler
/// written for the baseline query type. Output is untouched.
template <typename NewQ, entry_point_kind Kind, typename C>
handler<Kind, NewQ, C> cast_query(
    handler<Kind, multitest::schema::empty_t, C> inner) {
  return detail::adapt<Kind, NewQ, C>(std::move(inner), detail::narrow_deps{},
                                      detail::keep_output{});
}

/// Widen every response of a handler written for the baseline message type
/// to NewC. Query handlers produce raw bytes and come back as they are.
template <typename NewC, entry_point_kind Kind, typename Q>
auto cast_message(handler<Kind, Q, multitest::schema::empty_t> inner) {
  if constexpr (Kind == entry_point_kind::query) {
    return inner;
  } else {
    return detail::adapt<Kind, Q, NewC>(std::move(inner), detail::keep_deps{},
                                        detail::widen_response<NewC>{});
  }
}

/// Both at once: a fully baseline handler made usable by a (NewQ, NewC)
/// contract.
template <typename NewQ, typename NewC, entry_point_kind Kind>
auto cast(handler<Kind, multitest::schema::empty_t, multitest::schema::empty_t>
              inner) {
  return cast_message<NewC>(cast_query<NewQ>(std::move(inner)));
}

}  // namespace multitest::contracts
