#pragma once
#include <multitest/storage/storage.hpp>
#include <map>
#include <optional>
#include <vector>

namespace multitest::storage {

struct memory_storage_tag {};

/// Ordered in-memory store; the default backend of mock dependencies.
template <>
class backend<memory_storage_tag> final : public storage {
 public:
  std::optional<multitest::schema::bytes_t> get(
      const multitest::schema::bytes_view_t& key) const override;
  void set(const multitest::schema::bytes_view_t& key,
           const multitest::schema::bytes_view_t& value) override;
  void remove(const multitest::schema::bytes_view_t& key) override;
  std::vector<key_value_entry_t> range(
      const std::optional<multitest::schema::bytes_view_t>& start,
      const std::optional<multitest::schema::bytes_view_t>& end,
      order_t order) const override;

  size_t size() const;

 private:
  std::map<multitest::schema::bytes_t, multitest::schema::bytes_t> data_;
};

using memory_storage_t = backend<memory_storage_tag>;

}  // namespace multitest::storage
