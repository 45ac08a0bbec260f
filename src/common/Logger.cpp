#include "common/Logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace sguard::common {

bool Logger::_bInitialized = false;

void Logger::init(const std::string& sLevel) {
  const auto level = spdlog::level::from_str(sLevel);
  if (_bInitialized) {
    spdlog::set_level(level);
    return;
  }

  auto spLogger = spdlog::get("sguard");
  if (!spLogger) {
    spLogger = spdlog::stdout_color_mt("sguard");
  }
  spLogger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");
  spLogger->set_level(level);
  spdlog::set_default_logger(spLogger);

  _bInitialized = true;
  spLogger->debug("Logger initialized at level '{}'", sLevel);
}

std::shared_ptr<spdlog::logger> Logger::get() {
  if (!_bInitialized) {
    init("info");
  }
  return spdlog::default_logger();
}

}  // namespace sguard::common
