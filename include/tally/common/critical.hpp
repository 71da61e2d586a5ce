#pragma once

#include <csignal>
#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

namespace tally::common {

/// Log, flush every sink, and stop the process. Reserved for broken storage
/// or codec invariants; rejected commands never end up here.
template <typename... Args>
[[noreturn]] void critical(spdlog::format_string_t<Args...> format,
                           Args&&... args) {
  spdlog::critical(format, std::forward<Args>(args)...);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace tally::common
