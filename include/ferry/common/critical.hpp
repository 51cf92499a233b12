#pragma once

#include <csignal>
#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

namespace ferry::common {

/// Log a formatted critical message and stop the process.
///
/// Reserved for failures no caller can recover from: the ledger cannot be
/// read or written, or a stored row breaks an invariant.
template <typename... Args>
[[noreturn]] void critical(spdlog::format_string_t<Args...> format,
                           Args&&... args) {
  spdlog::critical(format, std::forward<Args>(args)...);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace ferry::common
