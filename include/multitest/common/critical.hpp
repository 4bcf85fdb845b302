#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace multitest::common {

/// Report a broken invariant and terminate the process.
///
/// Used for conditions that cannot be produced by well-typed input (for
/// example a custom message built under the baseline extension type). These
/// are never surfaced to the host engine as recoverable errors.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace multitest::common
