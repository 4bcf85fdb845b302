#include <multitest/storage/memory/storage.hpp>

#include <algorithm>
#include <iterator>

using namespace multitest::schema;

namespace multitest::storage {

std::optional<bytes_t> backend<memory_storage_tag>::get(
    const bytes_view_t& key) const {
  auto it = data_.find(make_bytes(key));
  if (it == std::end(data_)) {
    return std::nullopt;
  }
  return it->second;
}

void backend<memory_storage_tag>::set(const bytes_view_t& key,
                                      const bytes_view_t& value) {
  data_.insert_or_assign(make_bytes(key), make_bytes(value));
}

void backend<memory_storage_tag>::remove(const bytes_view_t& key) {
  data_.erase(make_bytes(key));
}

std::vector<key_value_entry_t> backend<memory_storage_tag>::range(
    const std::optional<bytes_view_t>& start,
    const std::optional<bytes_view_t>& end,
    const order_t order) const {
  auto first = start ? data_.lower_bound(make_bytes(*start)) : data_.begin();
  auto last = end ? data_.lower_bound(make_bytes(*end)) : data_.end();

  auto entries = std::vector<key_value_entry_t>{};
  if (start && end && !std::ranges::lexicographical_compare(*start, *end)) {
    return entries;
  }
  entries.assign(first, last);
  if (order == order_t::descending) {
    std::reverse(std::begin(entries), std::end(entries));
  }
  return entries;
}

size_t backend<memory_storage_tag>::size() const {
  return data_.size();
}

}  // namespace multitest::storage
