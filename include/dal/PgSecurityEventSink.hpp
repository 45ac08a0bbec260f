#pragma once

#include "security/ISecurityEventSink.hpp"

namespace sguard::dal {

class ConnectionPool;

/// Appends security events to the security_events table.
/// Class abbreviation: pes
class PgSecurityEventSink : public security::ISecurityEventSink {
 public:
  explicit PgSecurityEventSink(ConnectionPool& cpPool);
  ~PgSecurityEventSink() override;

  void append(const common::SecurityEvent& ev) override;

 private:
  ConnectionPool& _cpPool;
};

}  // namespace sguard::dal
