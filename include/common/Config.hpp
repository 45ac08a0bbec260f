#pragma once

#include <string>

#include "common/Types.hpp"

namespace sguard::common {

/// Environment variable loader. Loads all SGUARD_* vars into a typed struct
/// with validation.
/// Class abbreviation: cfg
struct Config {
  // ── Required ──────────────────────────────────────────────────────────
  std::string sDbUrl;

  // ── Database ──────────────────────────────────────────────────────────
  int iDbPoolSize = 4;

  // ── Logging ───────────────────────────────────────────────────────────
  std::string sLogLevel = "info";

  // ── Session lifecycle ─────────────────────────────────────────────────
  SessionPolicy spPolicy;

  // ── Janitor ───────────────────────────────────────────────────────────
  int iJanitorIntervalSeconds = 300;

  // ── Security events ───────────────────────────────────────────────────
  bool bSecurityEventsStdout = false;

  /// Load and validate all config from environment variables.
  /// SGUARD_DB_URL may be supplied through SGUARD_DB_URL_FILE instead.
  /// Throws std::runtime_error on missing required vars or invalid constraints.
  static Config load();

 private:
  /// Read an env var with _FILE fallback. Trims trailing whitespace from
  /// file contents. Throws if neither is set.
  static std::string loadSecret(const char* pVarName);

  static std::string getEnv(const char* pVarName);
  static int getEnvInt(const char* pVarName, int iDefault);
  static bool getEnvBool(const char* pVarName, bool bDefault);
};

}  // namespace sguard::common
