#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace credence::common {

/// Log, flush and terminate. Reserved for storage faults the engine cannot
/// report as a protocol error (closed database, failed write batch, corrupt
/// row).
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

[[noreturn]] inline void critical(const std::string_view message,
                                  const std::string_view detail) {
  spdlog::critical("{}: {}", message, detail);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace credence::common
