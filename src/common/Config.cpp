#include "common/Config.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace sguard::common {

namespace {

void requireAtLeast(const char* pVarName, int iValue, int iMin) {
  if (iValue < iMin) {
    throw std::runtime_error(std::string(pVarName) + " must be >= " + std::to_string(iMin) +
                             " (got " + std::to_string(iValue) + ")");
  }
}

}  // namespace

std::string Config::getEnv(const char* pVarName) {
  const char* pValue = std::getenv(pVarName);
  return pValue ? std::string(pValue) : std::string{};
}

int Config::getEnvInt(const char* pVarName, int iDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return iDefault;
  }
  size_t nParsed = 0;
  int iValue = 0;
  try {
    iValue = std::stoi(sValue, &nParsed);
  } catch (const std::exception&) {
    throw std::runtime_error(
        std::string("Invalid integer value for ") + pVarName + ": " + sValue);
  }
  if (nParsed != sValue.size()) {
    throw std::runtime_error(
        std::string("Invalid integer value for ") + pVarName + ": " + sValue);
  }
  return iValue;
}

bool Config::getEnvBool(const char* pVarName, bool bDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return bDefault;
  }
  if (sValue == "true" || sValue == "1" || sValue == "yes") return true;
  if (sValue == "false" || sValue == "0" || sValue == "no") return false;
  throw std::runtime_error(
      std::string("Invalid boolean value for ") + pVarName + ": " + sValue);
}

std::string Config::loadSecret(const char* pVarName) {
  std::string sValue = getEnv(pVarName);
  if (!sValue.empty()) {
    return sValue;
  }

  const std::string sFileVar = std::string(pVarName) + "_FILE";
  const std::string sFilePath = getEnv(sFileVar.c_str());
  if (sFilePath.empty()) {
    throw std::runtime_error(
        std::string("Required variable not set: neither ") + pVarName + " nor " + sFileVar +
        " is defined");
  }

  std::ifstream ifs(sFilePath);
  if (!ifs.is_open()) {
    throw std::runtime_error(
        std::string("Cannot open file specified by ") + sFileVar + ": " + sFilePath);
  }

  std::ostringstream oss;
  oss << ifs.rdbuf();
  sValue = oss.str();

  while (!sValue.empty() &&
         (sValue.back() == '\n' || sValue.back() == '\r' || sValue.back() == ' ')) {
    sValue.pop_back();
  }

  if (sValue.empty()) {
    throw std::runtime_error(
        std::string("File is empty: ") + sFilePath + " (from " + sFileVar + ")");
  }

  return sValue;
}

Config Config::load() {
  Config cfg;

  // ── Required vars ──────────────────────────────────────────────────────
  cfg.sDbUrl = loadSecret("SGUARD_DB_URL");

  // ── Optional vars with defaults ────────────────────────────────────────
  cfg.iDbPoolSize = getEnvInt("SGUARD_DB_POOL_SIZE", 4);

  const std::string sLogLevel = getEnv("SGUARD_LOG_LEVEL");
  if (!sLogLevel.empty()) {
    cfg.sLogLevel = sLogLevel;
  }

  // Session lifecycle
  SessionPolicy& sp = cfg.spPolicy;
  sp.iMaxSessions = getEnvInt("SGUARD_MAX_SESSIONS", sp.iMaxSessions);
  sp.iSessionTimeoutMinutes =
      getEnvInt("SGUARD_SESSION_TIMEOUT_MINUTES", sp.iSessionTimeoutMinutes);
  sp.iExtendedSessionTimeoutMinutes =
      getEnvInt("SGUARD_EXTENDED_SESSION_TIMEOUT_MINUTES", sp.iExtendedSessionTimeoutMinutes);
  sp.iInactivityTimeoutMinutes =
      getEnvInt("SGUARD_INACTIVITY_TIMEOUT_MINUTES", sp.iInactivityTimeoutMinutes);
  sp.bRequireReauthForSensitive =
      getEnvBool("SGUARD_REQUIRE_REAUTH_FOR_SENSITIVE", sp.bRequireReauthForSensitive);
  sp.bEnableConcurrentSessions =
      getEnvBool("SGUARD_ENABLE_CONCURRENT_SESSIONS", sp.bEnableConcurrentSessions);
  sp.bEnableDeviceTracking =
      getEnvBool("SGUARD_ENABLE_DEVICE_TRACKING", sp.bEnableDeviceTracking);
  sp.bEnableLocationTracking =
      getEnvBool("SGUARD_ENABLE_LOCATION_TRACKING", sp.bEnableLocationTracking);
  sp.bEnableSuspiciousActivityDetection = getEnvBool(
      "SGUARD_ENABLE_SUSPICIOUS_ACTIVITY_DETECTION", sp.bEnableSuspiciousActivityDetection);
  sp.iRapidCreationThreshold =
      getEnvInt("SGUARD_RAPID_CREATION_THRESHOLD", sp.iRapidCreationThreshold);
  sp.iRapidCreationWindowSeconds =
      getEnvInt("SGUARD_RAPID_CREATION_WINDOW_SECONDS", sp.iRapidCreationWindowSeconds);

  // Janitor
  cfg.iJanitorIntervalSeconds = getEnvInt("SGUARD_JANITOR_INTERVAL_SECONDS", 300);

  // Security events
  cfg.bSecurityEventsStdout = getEnvBool("SGUARD_SECURITY_EVENTS_STDOUT", false);

  // ── Validation ─────────────────────────────────────────────────────────
  requireAtLeast("SGUARD_DB_POOL_SIZE", cfg.iDbPoolSize, 1);
  requireAtLeast("SGUARD_MAX_SESSIONS", sp.iMaxSessions, 1);
  requireAtLeast("SGUARD_SESSION_TIMEOUT_MINUTES", sp.iSessionTimeoutMinutes, 1);
  requireAtLeast("SGUARD_EXTENDED_SESSION_TIMEOUT_MINUTES",
                 sp.iExtendedSessionTimeoutMinutes, 1);
  requireAtLeast("SGUARD_INACTIVITY_TIMEOUT_MINUTES", sp.iInactivityTimeoutMinutes, 1);
  requireAtLeast("SGUARD_RAPID_CREATION_THRESHOLD", sp.iRapidCreationThreshold, 0);
  requireAtLeast("SGUARD_RAPID_CREATION_WINDOW_SECONDS", sp.iRapidCreationWindowSeconds, 1);
  requireAtLeast("SGUARD_JANITOR_INTERVAL_SECONDS", cfg.iJanitorIntervalSeconds, 1);

  // Remember-me timeout >= standard timeout
  if (sp.iExtendedSessionTimeoutMinutes < sp.iSessionTimeoutMinutes) {
    throw std::runtime_error(
        "SGUARD_EXTENDED_SESSION_TIMEOUT_MINUTES (" +
        std::to_string(sp.iExtendedSessionTimeoutMinutes) +
        ") must be >= SGUARD_SESSION_TIMEOUT_MINUTES (" +
        std::to_string(sp.iSessionTimeoutMinutes) + ")");
  }

  return cfg;
}

}  // namespace sguard::common
