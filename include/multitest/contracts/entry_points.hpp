#pragma once

#include <multitest/common/error.hpp>
#include <multitest/host/deps.hpp>
#include <multitest/schema/empty.hpp>
#include <multitest/schema/encoding/scale/encoder.hpp>
#include <multitest/schema/enum_string.hpp>
#include <multitest/schema/env.hpp>
#include <multitest/schema/primitives.hpp>
#include <multitest/schema/reply.hpp>
#include <multitest/schema/response.hpp>
#include <array>
#include <cstdint>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace multitest::contracts {

enum class entry_point_kind : uint8_t {
  instantiate = 0,
  execute = 1,
  query = 2,
  sudo = 3,
  reply = 4,
  migrate = 5
};

inline constexpr auto kEntryPointKindMappings = std::array{
    std::pair<std::string_view, entry_point_kind>{
        "instantiate", entry_point_kind::instantiate},
    std::pair<std::string_view, entry_point_kind>{"execute",
                                                  entry_point_kind::execute},
    std::pair<std::string_view, entry_point_kind>{"query",
                                                  entry_point_kind::query},
    std::pair<std::string_view, entry_point_kind>{"sudo",
                                                  entry_point_kind::sudo},
    std::pair<std::string_view, entry_point_kind>{"reply",
                                                  entry_point_kind::reply},
    std::pair<std::string_view, entry_point_kind>{"migrate",
                                                  entry_point_kind::migrate},
};

std::optional<entry_point_kind> try_entry_point_kind_from_string(
    std::string_view value);

constexpr std::string_view to_string(const entry_point_kind value) {
  return multitest::schema::name_or_unknown(value, kEntryPointKindMappings);
}

/// Failure every entry point left at its default reports, e.g.
/// "Sudo not implemented on the contract".
multitest::common::error not_implemented_error(entry_point_kind kind);

/// Outer message attached to payload decoding failures.
std::string decode_failure_context(entry_point_kind kind);

// Calling shapes. Every handler, whatever message type it was written
// against, is reduced to one of these four byte-level signatures.

/// instantiate / execute: mutable context, env, sender info, payload.
template <typename Q, typename C>
struct sender_entry_point_traits {
  using deps_t = multitest::host::deps_mut<Q>;
  using output_t = multitest::schema::response<C>;
  using function_t = std::function<multitest::common::result<output_t>(
      deps_t,
      const multitest::schema::env_t&,
      const multitest::schema::message_info_t&,
      const multitest::schema::bytes_view_t&)>;
  static constexpr auto kTakesSender = true;
  static constexpr auto kDecodesPayload = true;
};

/// sudo / migrate: mutable context, env, payload. No sender.
template <typename Q, typename C>
struct privileged_entry_point_traits {
  using deps_t = multitest::host::deps_mut<Q>;
  using output_t = multitest::schema::response<C>;
  using function_t = std::function<multitest::common::result<output_t>(
      deps_t,
      const multitest::schema::env_t&,
      const multitest::schema::bytes_view_t&)>;
  static constexpr auto kTakesSender = false;
  static constexpr auto kDecodesPayload = true;
};

/// reply: mutable context, env, and the typed reply record.
template <typename Q, typename C>
struct reply_entry_point_traits {
  using deps_t = multitest::host::deps_mut<Q>;
  using output_t = multitest::schema::response<C>;
  using function_t = std::function<multitest::common::result<output_t>(
      deps_t,
      const multitest::schema::env_t&,
      const multitest::schema::reply_t&)>;
  static constexpr auto kTakesSender = false;
  static constexpr auto kDecodesPayload = false;
};

/// query: read-only context, env, payload. Produces raw bytes, so the
/// message extension type plays no part.
template <typename Q>
struct query_entry_point_traits {
  using deps_t = multitest::host::deps<Q>;
  using output_t = multitest::schema::binary_t;
  using function_t = std::function<multitest::common::result<output_t>(
      deps_t,
      const multitest::schema::env_t&,
      const multitest::schema::bytes_view_t&)>;
  static constexpr auto kTakesSender = false;
  static constexpr auto kDecodesPayload = true;
};

template <entry_point_kind Kind, typename Q, typename C>
struct entry_point_traits;

template <typename Q, typename C>
struct entry_point_traits<entry_point_kind::instantiate, Q, C>
    : sender_entry_point_traits<Q, C> {};

template <typename Q, typename C>
struct entry_point_traits<entry_point_kind::execute, Q, C>
    : sender_entry_point_traits<Q, C> {};

template <typename Q, typename C>
struct entry_point_traits<entry_point_kind::query, Q, C>
    : query_entry_point_traits<Q> {};

template <typename Q, typename C>
struct entry_point_traits<entry_point_kind::sudo, Q, C>
    : privileged_entry_point_traits<Q, C> {};

template <typename Q, typename C>
struct entry_point_traits<entry_point_kind::reply, Q, C>
    : reply_entry_point_traits<Q, C> {};

template <typename Q, typename C>
struct entry_point_traits<entry_point_kind::migrate, Q, C>
    : privileged_entry_point_traits<Q, C> {};

/// Type-erased entry point of kind `Kind`, bound to query extension Q and
/// message extension C.
///
/// The concrete message type the logic was written against is fixed when the
/// handler is built (see `bind`) and hidden behind the byte-level signature,
/// so handlers for different message types are interchangeable wherever the
/// kind and extension types agree. Query handlers always use C = empty_t.
template <entry_point_kind Kind,
          typename Q = multitest::schema::empty_t,
          typename C = multitest::schema::empty_t>
class handler final {
  static_assert(Kind != entry_point_kind::query ||
                    std::is_same_v<C, multitest::schema::empty_t>,
                "query handlers do not carry a message extension type");

 public:
  using traits_t = entry_point_traits<Kind, Q, C>;
  using deps_t = typename traits_t::deps_t;
  using output_t = typename traits_t::output_t;
  using function_t = typename traits_t::function_t;

  static constexpr auto kind = Kind;

  explicit handler(function_t function) : function_{std::move(function)} {}

  template <typename... Args>
  multitest::common::result<output_t> call(Args&&... args) const {
    return function_(std::forward<Args>(args)...);
  }

 private:
  function_t function_;
};

namespace detail {

template <typename T>
inline constexpr bool kAlwaysFalse = false;

/// Splits what a handler returns into its success type and, for fallible
/// handlers declared as std::variant<T, E>, its error type.
template <typename R>
struct handler_return {
  using value_t = R;
  using error_t = void;
};

template <typename T, typename E>
struct handler_return<std::variant<T, E>> {
  using value_t = T;
  using error_t = E;
};

template <typename T>
struct message_extension {
  using type = multitest::schema::empty_t;
};

template <typename C>
struct message_extension<multitest::schema::response<C>> {
  using type = C;
};

template <typename R>
using message_extension_t =
    typename message_extension<typename handler_return<R>::value_t>::type;

template <typename T, typename R>
multitest::common::result<T> normalize(R&& returned) {
  using returned_t = std::remove_cvref_t<R>;
  using value_t = typename handler_return<returned_t>::value_t;
  using error_t = typename handler_return<returned_t>::error_t;
  static_assert(std::is_convertible_v<value_t, T>,
                "handler success value does not match the entry point output");

  if constexpr (std::is_void_v<error_t>) {
    return multitest::common::result<T>{std::in_place_index<0>,
                                        std::forward<R>(returned)};
  } else {
    static_assert(multitest::common::is_error_convertible_v<error_t>,
                  "handler error type cannot be converted to common::error");
    if (returned.index() == 0) {
      return multitest::common::result<T>{
          std::in_place_index<0>, std::get<0>(std::forward<R>(returned))};
    }
    return multitest::common::result<T>{
        std::in_place_index<1>,
        multitest::common::to_error(std::get<1>(returned))};
  }
}

/// Run user logic and fold its outcome into the uniform result. A thrown
/// std::exception is a handler failure like any other.
template <typename T, typename F, typename... Args>
multitest::common::result<T> invoke(const F& logic, Args&&... args) {
  try {
    return normalize<T>(std::invoke(logic, std::forward<Args>(args)...));
  } catch (const std::exception& ex) {
    return multitest::common::error{ex.what()};
  }
}

template <typename Msg>
multitest::common::result<Msg> decode_message(
    const entry_point_kind kind,
    const multitest::schema::bytes_view_t& payload) {
  auto encoder = multitest::schema::encoding::scale_encoder_t{};
  auto reason = std::string{};
  auto decoded = encoder.try_decode<Msg>(payload, reason);
  if (!decoded) {
    return multitest::common::error{reason}.context(
        decode_failure_context(kind));
  }
  return multitest::common::result<Msg>{std::in_place_index<0>,
                                        std::move(*decoded)};
}

template <entry_point_kind Kind, typename Msg, typename Q, typename C>
struct bindable {
  using traits_t = entry_point_traits<Kind, Q, C>;

  template <typename F>
  static constexpr bool check() {
    if constexpr (traits_t::kTakesSender) {
      return std::is_invocable_v<const F&, typename traits_t::deps_t&,
                                 const multitest::schema::env_t&,
                                 const multitest::schema::message_info_t&,
                                 const Msg&>;
    } else {
      return std::is_invocable_v<const F&, typename traits_t::deps_t&,
                                 const multitest::schema::env_t&, const Msg&>;
    }
  }
};

}  // namespace detail

/// True when `F` can serve as a `Kind` entry point for message type `Msg`.
template <entry_point_kind Kind,
          typename F,
          typename Msg,
          typename Q = multitest::schema::empty_t,
          typename C = multitest::schema::empty_t>
inline constexpr bool is_bindable_v =
    detail::bindable<Kind, Msg, Q, C>::template check<F>();

/// Bind arbitrary logic to entry point kind `Kind`. `Msg` is the message type
/// the payload is decoded into before `logic` sees it; for `reply` it must be
/// `reply_t`, which is passed through without decoding.
///
/// `logic` may return the output value directly or a
/// std::variant<output, E> where E converts to common::error.
template <entry_point_kind Kind,
          typename Msg,
          typename Q = multitest::schema::empty_t,
          typename C = multitest::schema::empty_t,
          typename F>
handler<Kind, Q, C> bind(F logic) {
  using traits_t = entry_point_traits<Kind, Q, C>;
  using deps_t = typename traits_t::deps_t;
  using output_t = typename traits_t::output_t;

  static_assert(is_bindable_v<Kind, F, Msg, Q, C>,
                "logic does not match the calling shape of this entry point");

  if constexpr (traits_t::kTakesSender) {
    return handler<Kind, Q, C>{
        [logic = std::move(logic)](
            deps_t deps, const multitest::schema::env_t& env,
            const multitest::schema::message_info_t& info,
            const multitest::schema::bytes_view_t& payload)
            -> multitest::common::result<output_t> {
          auto msg = detail::decode_message<Msg>(Kind, payload);
          if (!multitest::common::is_ok(msg)) {
            return multitest::common::error_of(msg);
          }
          return detail::invoke<output_t>(logic, deps, env, info,
                                          multitest::common::value(msg));
        }};
  } else if constexpr (traits_t::kDecodesPayload) {
    return handler<Kind, Q, C>{
        [logic = std::move(logic)](
            deps_t deps, const multitest::schema::env_t& env,
            const multitest::schema::bytes_view_t& payload)
            -> multitest::common::result<output_t> {
          auto msg = detail::decode_message<Msg>(Kind, payload);
          if (!multitest::common::is_ok(msg)) {
            return multitest::common::error_of(msg);
          }
          return detail::invoke<output_t>(logic, deps, env,
                                          multitest::common::value(msg));
        }};
  } else {
    static_assert(std::is_same_v<Msg, multitest::schema::reply_t>,
                  "reply handlers take the reply record itself");
    return handler<Kind, Q, C>{
        [logic = std::move(logic)](deps_t deps,
                                   const multitest::schema::env_t& env,
                                   const multitest::schema::reply_t& reply)
            -> multitest::common::result<output_t> {
          return detail::invoke<output_t>(logic, deps, env, reply);
        }};
  }
}

/// Plain functions: message and extension types are read off the signature.
template <entry_point_kind Kind, typename R, typename Q, typename Msg>
auto bind(R (*logic)(multitest::host::deps_mut<Q>,
                     const multitest::schema::env_t&,
                     const multitest::schema::message_info_t&,
                     Msg)) {
  return bind<Kind, std::remove_cvref_t<Msg>, Q,
              detail::message_extension_t<R>>(logic);
}

template <entry_point_kind Kind, typename R, typename Q, typename Msg>
auto bind(R (*logic)(multitest::host::deps_mut<Q>,
                     const multitest::schema::env_t&,
                     Msg)) {
  return bind<Kind, std::remove_cvref_t<Msg>, Q,
              detail::message_extension_t<R>>(logic);
}

template <entry_point_kind Kind, typename R, typename Q, typename Msg>
auto bind(R (*logic)(multitest::host::deps<Q>,
                     const multitest::schema::env_t&,
                     Msg)) {
  return bind<Kind, std::remove_cvref_t<Msg>, Q>(logic);
}

/// Stand-ins for optional entry points. They fail on every call without
/// looking at the payload.
template <typename Q = multitest::schema::empty_t,
          typename C = multitest::schema::empty_t>
handler<entry_point_kind::sudo, Q, C> default_sudo_handler() {
  return handler<entry_point_kind::sudo, Q, C>{
      [](multitest::host::deps_mut<Q>, const multitest::schema::env_t&,
         const multitest::schema::bytes_view_t&)
          -> multitest::common::result<multitest::schema::response<C>> {
        return not_implemented_error(entry_point_kind::sudo);
      }};
}

template <typename Q = multitest::schema::empty_t,
          typename C = multitest::schema::empty_t>
handler<entry_point_kind::reply, Q, C> default_reply_handler() {
  return handler<entry_point_kind::reply, Q, C>{
      [](multitest::host::deps_mut<Q>, const multitest::schema::env_t&,
         const multitest::schema::reply_t&)
          -> multitest::common::result<multitest::schema::response<C>> {
        return not_implemented_error(entry_point_kind::reply);
      }};
}

template <typename Q = multitest::schema::empty_t,
          typename C = multitest::schema::empty_t>
handler<entry_point_kind::migrate, Q, C> default_migrate_handler() {
  return handler<entry_point_kind::migrate, Q, C>{
      [](multitest::host::deps_mut<Q>, const multitest::schema::env_t&,
         const multitest::schema::bytes_view_t&)
          -> multitest::common::result<multitest::schema::response<C>> {
        return not_implemented_error(entry_point_kind::migrate);
      }};
}

}  // namespace multitest::contracts
