#pragma once

#include "common/Types.hpp"

namespace sguard::security {

/// Pure abstract destination for security events. May throw on failure;
/// SecurityEventLog logs and drops the error.
class ISecurityEventSink {
 public:
  virtual ~ISecurityEventSink() = default;

  virtual void append(const common::SecurityEvent& ev) = 0;
};

}  // namespace sguard::security
