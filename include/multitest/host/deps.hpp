#pragma once

#include <multitest/host/api.hpp>
#include <multitest/host/querier.hpp>
#include <multitest/schema/empty.hpp>
#include <multitest/storage/storage.hpp>

namespace multitest::host {

/// Read-only request context handed to `query` entry points.
///
/// Every member is borrowed from the host for the duration of one call.
template <typename Q = multitest::schema::empty_t>
struct deps final {
  const multitest::storage::storage& storage;
  const multitest::host::api& api;
  querier_wrapper<Q> querier;
};

/// Mutable request context handed to state-mutating entry points. Grants
/// exclusive write access to storage for the duration of one call.
template <typename Q = multitest::schema::empty_t>
struct deps_mut final {
  multitest::storage::storage& storage;
  const multitest::host::api& api;
  querier_wrapper<Q> querier;

  deps<Q> as_ref() const { return deps<Q>{storage, api, querier}; }
};

}  // namespace multitest::host
