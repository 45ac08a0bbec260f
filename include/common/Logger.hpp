#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace sguard::common {

/// Thin wrapper over spdlog's default logger.
///
/// Usage:
///   Logger::init("debug");
///   Logger::get()->info("Janitor evicted {} sessions", iCount);
class Logger {
 public:
  /// Valid levels: "trace", "debug", "info", "warn", "error", "critical", "off"
  static void init(const std::string& sLevel);

  /// Returns spdlog's default logger, initializing at "info" on first use.
  static std::shared_ptr<spdlog::logger> get();

 private:
  static bool _bInitialized;
};

}  // namespace sguard::common
