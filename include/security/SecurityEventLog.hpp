#pragma once

#include <atomic>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "common/Types.hpp"
#include "core/ThreadPool.hpp"

namespace sguard::security {

class ISecurityEventSink;

/// Fire-and-forget front for an ISecurityEventSink. emit() queues the event on
/// a private worker and returns immediately; sink failures are logged and
/// counted, never propagated.
/// Class abbreviation: sel
class SecurityEventLog {
 public:
  explicit SecurityEventLog(ISecurityEventSink& sesSink);
  ~SecurityEventLog();

  SecurityEventLog(const SecurityEventLog&) = delete;
  SecurityEventLog& operator=(const SecurityEventLog&) = delete;

  void emit(const std::string& sUserId, const std::string& sType, common::TimePoint tpAt,
            nlohmann::json jMetadata);

  /// Wait until every queued event has reached the sink (or failed).
  void flush();

  int64_t failedCount() const { return _iFailed.load(); }

 private:
  ISecurityEventSink& _sesSink;
  std::atomic<int64_t> _iFailed{0};
  core::ThreadPool _tpDispatch;
};

}  // namespace sguard::security
