#pragma once

#include "security/ISecurityEventSink.hpp"

namespace sguard::security {

/// Writes each event as one JSON line through the application logger.
/// Selected with SGUARD_SECURITY_EVENTS_STDOUT=true.
class LogSecurityEventSink : public ISecurityEventSink {
 public:
  void append(const common::SecurityEvent& ev) override;
};

}  // namespace sguard::security
