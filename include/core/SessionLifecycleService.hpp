#pragma once

#include <array>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "common/Types.hpp"
#include "core/CapacityEnforcer.hpp"
#include "security/UserAgentClassifier.hpp"

namespace sguard::dal {
class SessionRecordStore;
}  // namespace sguard::dal

namespace sguard::security {
class IGeoLocator;
class SecurityEventLog;
class SecurityHeuristics;
}  // namespace sguard::security

namespace sguard::core {

class IClock;

/// Public entry point of the subsystem, called in-process by the
/// authentication layer: on login (createSession), on every authenticated
/// request (validateSession) and on logout or revocation (terminate*).
///
/// Suspicious activity is flagged, never denied. Durable writes and security
/// events are queued and never awaited. createSession and
/// terminateAllUserSessions serialize per user (striped mutexes), so the
/// maxSessions bound holds even under concurrent logins.
/// Class abbreviation: sls
class SessionLifecycleService {
 public:
  SessionLifecycleService(const common::SessionPolicy& spPolicy,
                          dal::SessionRecordStore& srsStore,
                          security::SecurityHeuristics& shHeuristics,
                          security::SecurityEventLog& selEvents,
                          const IClock& clkClock,
                          security::IGeoLocator* pGeoLocator = nullptr);
  ~SessionLifecycleService();

  SessionLifecycleService(const SessionLifecycleService&) = delete;
  SessionLifecycleService& operator=(const SessionLifecycleService&) = delete;

  /// Mint a session for an already-authenticated user.
  /// Throws common::ValidationError on empty user id, IP or user agent.
  common::CreateSessionResult createSession(const std::string& sUserId,
                                            const common::CreateSessionRequest& req);

  /// Check, in order: existence, absolute expiry, active flag, inactivity.
  /// An IP change flags the session and requests reauth but keeps it valid.
  /// With bSensitiveAction, an untrusted session also reports requiresReauth
  /// when the policy demands reauth for sensitive actions. Never throws.
  common::ValidationResult validateSession(const std::string& sSessionId,
                                           const std::optional<std::string>& oIpAddress =
                                               std::nullopt,
                                           bool bSensitiveAction = false);

  /// Idempotent; unknown or already terminated ids are a silent no-op.
  void terminateSession(const std::string& sSessionId, const std::string& sReason = "logout");

  /// "Log out everywhere" (but oExceptSessionId, when given).
  void terminateAllUserSessions(const std::string& sUserId,
                                const std::optional<std::string>& oExceptSessionId =
                                    std::nullopt);

  /// Active, unexpired sessions across both tiers, oldest first.
  std::vector<common::SessionRecord> getUserSessions(const std::string& sUserId);

  common::SessionStatistics getSessionStatistics() const;

  std::optional<common::DeviceFingerprint> findDeviceFingerprint(
      const std::string& sDeviceId) const;

 private:
  static constexpr size_t kUserLockStripes = 64;

  std::mutex& userLock(const std::string& sUserId);
  /// Emits session_terminated only for a real Active -> Inactive transition.
  void terminateInternal(const std::string& sSessionId, const std::string& sReason);
  int terminateAllUnlocked(const std::string& sUserId,
                           const std::optional<std::string>& oExceptSessionId);
  std::optional<common::Location> lookupLocation(const std::string& sIpAddress);

  common::SessionPolicy _spPolicy;
  dal::SessionRecordStore& _srsStore;
  security::SecurityHeuristics& _shHeuristics;
  security::SecurityEventLog& _selEvents;
  const IClock& _clkClock;
  security::IGeoLocator* _pGeoLocator;

  CapacityEnforcer _ceEnforcer;
  security::UserAgentClassifier _uacClassifier;
  std::array<std::mutex, kUserLockStripes> _aUserLocks;
};

}  // namespace sguard::core
