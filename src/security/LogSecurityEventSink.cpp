#include "security/LogSecurityEventSink.hpp"

#include "common/Logger.hpp"
#include "common/TypesJson.hpp"

#include <nlohmann/json.hpp>

namespace sguard::security {

void LogSecurityEventSink::append(const common::SecurityEvent& ev) {
  nlohmann::json jLine = {
      {"user_id", ev.sUserId},
      {"event_type", ev.sType},
      {"timestamp_ms", common::toEpochMillis(ev.tpTimestamp)},
      {"metadata", ev.jMetadata},
  };
  common::Logger::get()->info("security_event {}", jLine.dump());
}

}  // namespace sguard::security
