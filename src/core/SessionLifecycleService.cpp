#include "core/SessionLifecycleService.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/Clock.hpp"
#include "dal/SessionRecordStore.hpp"
#include "security/CryptoService.hpp"
#include "security/IGeoLocator.hpp"
#include "security/SecurityEventLog.hpp"
#include "security/SecurityHeuristics.hpp"

#include <algorithm>
#include <chrono>
#include <functional>
#include <unordered_set>

#include <nlohmann/json.hpp>

namespace sguard::core {

namespace {

constexpr const char* kReasonNotFound = "Session not found";
constexpr const char* kReasonExpired = "Session expired";
constexpr const char* kReasonInactive = "Session inactive";
constexpr const char* kReasonInactivity = "Session inactive too long";
constexpr const char* kReasonError = "Validation error";

common::ValidationResult invalid(common::ValidationFailure vfFailure, const char* pReason) {
  common::ValidationResult vr;
  vr.bIsValid = false;
  vr.vfFailure = vfFailure;
  vr.sReason = pReason;
  return vr;
}

}  // namespace

SessionLifecycleService::SessionLifecycleService(const common::SessionPolicy& spPolicy,
                                                 dal::SessionRecordStore& srsStore,
                                                 security::SecurityHeuristics& shHeuristics,
                                                 security::SecurityEventLog& selEvents,
                                                 const IClock& clkClock,
                                                 security::IGeoLocator* pGeoLocator)
    : _spPolicy(spPolicy),
      _srsStore(srsStore),
      _shHeuristics(shHeuristics),
      _selEvents(selEvents),
      _clkClock(clkClock),
      _pGeoLocator(pGeoLocator),
      _ceEnforcer(srsStore, spPolicy.iMaxSessions),
      _uacClassifier(security::UserAgentClassifier::withDefaultRules()) {}

SessionLifecycleService::~SessionLifecycleService() = default;

std::mutex& SessionLifecycleService::userLock(const std::string& sUserId) {
  return _aUserLocks[std::hash<std::string>{}(sUserId) % kUserLockStripes];
}

std::optional<common::Location> SessionLifecycleService::lookupLocation(
    const std::string& sIpAddress) {
  if (!_spPolicy.bEnableLocationTracking || _pGeoLocator == nullptr) {
    return std::nullopt;
  }
  try {
    return _pGeoLocator->lookup(sIpAddress);
  } catch (const std::exception& ex) {
    common::Logger::get()->warn("Location lookup for {} failed: {}", sIpAddress, ex.what());
    return std::nullopt;
  }
}

// ── createSession ──────────────────────────────────────────────────────────

common::CreateSessionResult SessionLifecycleService::createSession(
    const std::string& sUserId, const common::CreateSessionRequest& req) {
  if (sUserId.empty()) {
    throw common::ValidationError("invalid_user_id", "User id must not be empty");
  }
  if (req.sIpAddress.empty()) {
    throw common::ValidationError("invalid_ip_address", "IP address must not be empty");
  }
  if (req.sUserAgent.empty()) {
    throw common::ValidationError("invalid_user_agent", "User agent must not be empty");
  }

  auto oLocation = lookupLocation(req.sIpAddress);

  std::lock_guard<std::mutex> lock(userLock(sUserId));
  const auto tpNow = _clkClock.now();

  common::SessionRecord rec;
  rec.sSessionId = security::CryptoService::generateSessionId(tpNow);
  rec.sDeviceId = security::CryptoService::deriveDeviceId(req.sUserAgent, req.sIpAddress);

  // Make room before inserting so the bound holds as soon as we return
  if (!_spPolicy.bEnableConcurrentSessions) {
    terminateAllUnlocked(sUserId, std::nullopt);
  } else {
    _ceEnforcer.enforce(sUserId, tpNow, [this, &sUserId](const common::SessionRecord& recOld) {
      terminateInternal(recOld.sSessionId, "session_limit");
    });
  }

  rec.diDevice = _uacClassifier.classify(req.sUserAgent);

  auto vPrior = _srsStore.cachedActiveByUser(sUserId);
  std::erase_if(vPrior, [&](const auto& recPrior) { return recPrior.tpExpiresAt < tpNow; });
  const auto hv =
      _shHeuristics.detectAtCreation(sUserId, req.sIpAddress, rec.sDeviceId, vPrior, tpNow);

  const int iTimeoutMinutes = req.bRememberMe ? _spPolicy.iExtendedSessionTimeoutMinutes
                                              : _spPolicy.iSessionTimeoutMinutes;

  rec.sUserId = sUserId;
  rec.sIpAddress = req.sIpAddress;
  rec.sUserAgent = req.sUserAgent;
  rec.tpCreatedAt = tpNow;
  rec.tpLastActivity = tpNow;
  rec.tpExpiresAt = tpNow + std::chrono::minutes(std::max(iTimeoutMinutes, 1));
  rec.bIsActive = true;
  rec.sfFlags.bIsSecure = req.bSecureTransport;
  rec.sfFlags.bIsTrusted = !hv.bSuspicious;
  rec.sfFlags.bRequiresReauth = false;
  rec.sfFlags.bSuspiciousActivity = hv.bSuspicious;
  rec.oLocation = std::move(oLocation);

  if (_spPolicy.bEnableDeviceTracking && req.oFingerprint.has_value()) {
    _srsStore.rememberFingerprint(rec.sDeviceId, *req.oFingerprint);
  }

  _srsStore.create(rec);

  nlohmann::json jMeta = {
      {"sessionId", rec.sSessionId},
      {"deviceId", rec.sDeviceId},
      {"ipAddress", rec.sIpAddress},
      {"suspiciousActivity", hv.bSuspicious},
  };
  if (hv.bSuspicious) {
    jMeta["signal"] = hv.sSignal;
  }
  _selEvents.emit(sUserId, "session_created", tpNow, std::move(jMeta));

  common::Logger::get()->debug("Created session for user {} (device {}, {} / {})", sUserId,
                               rec.sDeviceId, rec.diDevice.sBrowser, rec.diDevice.sOs);
  return {rec.sSessionId, rec.tpExpiresAt};
}

// ── validateSession ────────────────────────────────────────────────────────

common::ValidationResult SessionLifecycleService::validateSession(
    const std::string& sSessionId, const std::optional<std::string>& oIpAddress,
    bool bSensitiveAction) {
  try {
    auto oRec = _srsStore.get(sSessionId);
    if (!oRec.has_value()) {
      return invalid(common::ValidationFailure::NotFound, kReasonNotFound);
    }
    auto& rec = *oRec;
    const auto tpNow = _clkClock.now();

    if (rec.tpExpiresAt < tpNow) {
      terminateInternal(sSessionId, "expired");
      return invalid(common::ValidationFailure::Expired, kReasonExpired);
    }

    if (!rec.bIsActive) {
      return invalid(common::ValidationFailure::Inactive, kReasonInactive);
    }

    if (tpNow - rec.tpLastActivity > std::chrono::minutes(_spPolicy.iInactivityTimeoutMinutes)) {
      terminateInternal(sSessionId, "inactivity");
      return invalid(common::ValidationFailure::InactivityTimeout, kReasonInactivity);
    }

    common::SessionFieldUpdate upd;
    upd.oLastActivity = tpNow;

    if (_shHeuristics.ipChanged(rec, oIpAddress)) {
      rec.sfFlags.bSuspiciousActivity = true;
      rec.sfFlags.bRequiresReauth = true;
      upd.oFlags = rec.sfFlags;
      _selEvents.emit(rec.sUserId, "ip_change", tpNow,
                      {{"sessionId", sSessionId},
                       {"oldIP", rec.sIpAddress},
                       {"newIP", *oIpAddress}});
    }

    if (auto oUpdated = _srsStore.updateFields(sSessionId, upd); oUpdated.has_value()) {
      rec = std::move(*oUpdated);
    } else {
      rec.tpLastActivity = std::max(rec.tpLastActivity, tpNow);
    }

    common::ValidationResult vr;
    vr.bIsValid = true;
    vr.bRequiresReauth = rec.sfFlags.bRequiresReauth;
    if (bSensitiveAction && _spPolicy.bRequireReauthForSensitive &&
        (!rec.sfFlags.bIsTrusted || rec.sfFlags.bSuspiciousActivity)) {
      vr.bRequiresReauth = true;
    }
    vr.oSession = std::move(rec);
    return vr;
  } catch (const std::exception& ex) {
    common::Logger::get()->error("Failed to validate session {}: {}", sSessionId, ex.what());
    return invalid(common::ValidationFailure::Error, kReasonError);
  }
}

// ── Termination ────────────────────────────────────────────────────────────

void SessionLifecycleService::terminateInternal(const std::string& sSessionId,
                                                const std::string& sReason) {
  try {
    // Read through first so a session known only to the durable tier is cached
    // and its Active -> Inactive transition is observed below
    _srsStore.get(sSessionId);

    auto oPrevious = _srsStore.markInactive(sSessionId);
    _srsStore.evict(sSessionId);
    if (!oPrevious.has_value()) {
      return;  // unknown or already inactive
    }

    _selEvents.emit(oPrevious->sUserId, "session_terminated", _clkClock.now(),
                    {{"sessionId", sSessionId}, {"reason", sReason}});
    common::Logger::get()->debug("Terminated session {} for user {} ({})", sSessionId,
                                 oPrevious->sUserId, sReason);
  } catch (const std::exception& ex) {
    common::Logger::get()->error("Failed to terminate session {}: {}", sSessionId, ex.what());
  }
}

void SessionLifecycleService::terminateSession(const std::string& sSessionId,
                                               const std::string& sReason) {
  terminateInternal(sSessionId, sReason);
}

int SessionLifecycleService::terminateAllUnlocked(
    const std::string& sUserId, const std::optional<std::string>& oExceptSessionId) {
  int iTerminated = 0;
  for (const auto& rec : _srsStore.listActiveByUser(sUserId)) {
    if (oExceptSessionId.has_value() && rec.sSessionId == *oExceptSessionId) continue;
    terminateInternal(rec.sSessionId, "force_logout");
    ++iTerminated;
  }
  _srsStore.deactivateAllForUser(sUserId, oExceptSessionId);
  return iTerminated;
}

void SessionLifecycleService::terminateAllUserSessions(
    const std::string& sUserId, const std::optional<std::string>& oExceptSessionId) {
  if (sUserId.empty()) {
    throw common::ValidationError("invalid_user_id", "User id must not be empty");
  }

  std::lock_guard<std::mutex> lock(userLock(sUserId));
  const int iTerminated = terminateAllUnlocked(sUserId, oExceptSessionId);
  common::Logger::get()->info("Terminated {} session(s) for user {}{}", iTerminated, sUserId,
                              oExceptSessionId.has_value() ? " (kept current)" : "");
}

// ── Queries ────────────────────────────────────────────────────────────────

std::vector<common::SessionRecord> SessionLifecycleService::getUserSessions(
    const std::string& sUserId) {
  if (sUserId.empty()) {
    throw common::ValidationError("invalid_user_id", "User id must not be empty");
  }

  const auto tpNow = _clkClock.now();
  auto vSessions = _srsStore.listActiveByUser(sUserId);
  std::erase_if(vSessions, [&](const auto& rec) { return rec.tpExpiresAt < tpNow; });
  std::sort(vSessions.begin(), vSessions.end(), [](const auto& recA, const auto& recB) {
    return recA.tpCreatedAt < recB.tpCreatedAt ||
           (recA.tpCreatedAt == recB.tpCreatedAt && recA.sSessionId < recB.sSessionId);
  });
  return vSessions;
}

common::SessionStatistics SessionLifecycleService::getSessionStatistics() const {
  const auto tpNow = _clkClock.now();
  common::SessionStatistics st;

  std::unordered_set<std::string> sUsers;
  double dTotalMinutes = 0.0;
  for (const auto& rec : _srsStore.snapshot()) {
    if (!rec.bIsActive || rec.tpExpiresAt < tpNow) continue;
    ++st.iActiveSessions;
    sUsers.insert(rec.sUserId);
    dTotalMinutes +=
        std::chrono::duration<double, std::ratio<60>>(tpNow - rec.tpCreatedAt).count();
  }

  st.iTotalUsers = static_cast<int64_t>(sUsers.size());
  if (st.iActiveSessions > 0) {
    st.dAverageSessionDurationMinutes = dTotalMinutes / static_cast<double>(st.iActiveSessions);
  }
  st.iSuspiciousActivities = _shHeuristics.totalSuspicious();
  return st;
}

std::optional<common::DeviceFingerprint> SessionLifecycleService::findDeviceFingerprint(
    const std::string& sDeviceId) const {
  return _srsStore.findFingerprint(sDeviceId);
}

}  // namespace sguard::core
