#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace sguard::common {

using TimePoint = std::chrono::system_clock::time_point;

/// Best-effort classification of a user-agent string.
/// Class abbreviation: di
struct DeviceInfo {
  std::string sBrowser = "Unknown";
  std::string sOs = "Unknown";
  std::string sDeviceClass = "Desktop";
  bool bIsMobile = false;
};

/// Advisory annotations. They inform step-up auth decisions; they never
/// invalidate a session on their own.
/// Class abbreviation: sf
struct SecurityFlags {
  bool bIsSecure = false;
  bool bIsTrusted = true;
  bool bRequiresReauth = false;
  bool bSuspiciousActivity = false;
};

/// IP-derived location, best-effort.
/// Class abbreviation: loc
struct Location {
  std::string sCountry;
  std::string sCity;
  std::string sTimezone;
};

/// Client-reported correlation data keyed by deviceId. Not a security boundary.
/// Class abbreviation: dfp
struct DeviceFingerprint {
  std::string sUserAgent;
  std::string sScreen;
  std::string sTimezone;
  std::string sLanguage;
  std::string sPlatform;
  bool bCookieEnabled = true;
  bool bDoNotTrack = false;
  std::string sHash;
};

/// Authenticated session as held in both storage tiers.
/// Class abbreviation: rec
struct SessionRecord {
  std::string sSessionId;
  std::string sUserId;
  std::string sDeviceId;
  std::string sIpAddress;
  std::string sUserAgent;
  DeviceInfo diDevice;
  TimePoint tpCreatedAt;
  TimePoint tpLastActivity;
  TimePoint tpExpiresAt;
  bool bIsActive = true;
  SecurityFlags sfFlags;
  std::optional<Location> oLocation;
};

/// Partial update; unset members are left untouched.
/// Class abbreviation: upd
struct SessionFieldUpdate {
  std::optional<TimePoint> oLastActivity;
  std::optional<bool> oIsActive;
  std::optional<SecurityFlags> oFlags;
};

/// Entry appended to the security event log.
/// Class abbreviation: ev
struct SecurityEvent {
  std::string sUserId;
  std::string sType;
  TimePoint tpTimestamp;
  nlohmann::json jMetadata = nlohmann::json::object();
};

/// Input to createSession beyond the user id.
/// Class abbreviation: req
struct CreateSessionRequest {
  std::string sIpAddress;
  std::string sUserAgent;
  bool bRememberMe = false;
  bool bSecureTransport = false;
  std::optional<DeviceFingerprint> oFingerprint;
};

/// Class abbreviation: csr
struct CreateSessionResult {
  std::string sSessionId;
  TimePoint tpExpiresAt;
};

/// Why a validation failed. None means the session is valid.
enum class ValidationFailure { None, NotFound, Expired, Inactive, InactivityTimeout, Error };

/// Outcome of validateSession. Never thrown.
/// Class abbreviation: vr
struct ValidationResult {
  bool bIsValid = false;
  std::optional<SessionRecord> oSession;
  bool bRequiresReauth = false;
  ValidationFailure vfFailure = ValidationFailure::None;
  std::string sReason;
};

/// Snapshot of cache-tier counters.
/// Class abbreviation: st
struct SessionStatistics {
  int64_t iActiveSessions = 0;
  int64_t iTotalUsers = 0;
  double dAverageSessionDurationMinutes = 0.0;
  int64_t iSuspiciousActivities = 0;
};

/// Lifecycle policy knobs. Defaults follow the product configuration.
/// Class abbreviation: sp
struct SessionPolicy {
  int iMaxSessions = 5;
  int iSessionTimeoutMinutes = 480;
  int iExtendedSessionTimeoutMinutes = 10080;
  int iInactivityTimeoutMinutes = 30;
  bool bRequireReauthForSensitive = true;
  bool bEnableConcurrentSessions = true;
  bool bEnableDeviceTracking = true;
  bool bEnableLocationTracking = false;
  bool bEnableSuspiciousActivityDetection = true;

  // Heuristic thresholds
  int iRapidCreationThreshold = 3;
  int iRapidCreationWindowSeconds = 300;
};

}  // namespace sguard::common
