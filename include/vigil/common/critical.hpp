#pragma once

#include <csignal>
#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

namespace vigil::common {

/// Log a fatal condition, flush every sink and terminate the process.
///
/// Only conditions outside of a monitoring pass (storage cannot be opened at
/// startup, logger cannot be created) are allowed to end up here.
template <typename... Args>
[[noreturn]] void critical(spdlog::format_string_t<Args...> format,
                           Args&&... args) {
  spdlog::critical(format, std::forward<Args>(args)...);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace vigil::common
