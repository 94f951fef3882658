#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace depot::common {

/// Log, flush and terminate. Reserved for conditions the service cannot
/// recover from (store cannot be opened, persisted bytes fail to decode).
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace depot::common
