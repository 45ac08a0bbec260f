#include "security/SecurityEventLog.hpp"

#include "common/Logger.hpp"
#include "security/ISecurityEventSink.hpp"

#include <utility>

namespace sguard::security {

SecurityEventLog::SecurityEventLog(ISecurityEventSink& sesSink)
    : _sesSink(sesSink), _tpDispatch("security-events", 1) {}

SecurityEventLog::~SecurityEventLog() {
  _tpDispatch.shutdown();
}

void SecurityEventLog::emit(const std::string& sUserId, const std::string& sType,
                            common::TimePoint tpAt, nlohmann::json jMetadata) {
  common::SecurityEvent ev{sUserId, sType, tpAt, std::move(jMetadata)};
  const bool bQueued = _tpDispatch.post([this, ev = std::move(ev)]() {
    try {
      _sesSink.append(ev);
    } catch (const std::exception& ex) {
      _iFailed.fetch_add(1);
      common::Logger::get()->warn("Failed to log security event '{}' for user {}: {}",
                                  ev.sType, ev.sUserId, ex.what());
    }
  });
  if (!bQueued) {
    _iFailed.fetch_add(1);
    common::Logger::get()->warn("Security event '{}' dropped: event log is shut down", sType);
  }
}

void SecurityEventLog::flush() {
  _tpDispatch.waitIdle();
}

}  // namespace sguard::security
