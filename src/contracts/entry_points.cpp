#include <multitest/contracts/entry_points.hpp>
#include <spdlog/fmt/fmt.h>

namespace multitest::contracts {

std::optional<entry_point_kind> try_entry_point_kind_from_string(
    const std::string_view value) {
  return multitest::schema::from_string(value, kEntryPointKindMappings);
}

multitest::common::error not_implemented_error(const entry_point_kind kind) {
  switch (kind) {
    case entry_point_kind::sudo:
      return multitest::common::error{"Sudo not implemented on the contract"};
    case entry_point_kind::reply:
      return multitest::common::error{"Reply not implemented on the contract"};
    case entry_point_kind::migrate:
      return multitest::common::error{
          "Migrate not implemented on the contract"};
    default:
      break;
  }
  auto name = std::string{to_string(kind)};
  if (!name.empty()) {
    name[0] = static_cast<char>(name[0] - 'a' + 'A');
  }
  return multitest::common::error{
      fmt::format("{} not implemented on the contract", name)};
}

std::string decode_failure_context(const entry_point_kind kind) {
  return fmt::format("Error parsing {} message", to_string(kind));
}

}  // namespace multitest::contracts
