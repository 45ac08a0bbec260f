#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/Types.hpp"

namespace sguard::security {

/// Advisory outcome of the creation-time check.
/// Class abbreviation: hv
struct HeuristicVerdict {
  bool bSuspicious = false;
  std::string sSignal;  // "rapid_creation", "unfamiliar_network" or empty
};

/// Anomaly scoring for session creation and validation. Flags only, never denies.
/// Keeps a per-user trail of creation times and a per-user count of positive
/// verdicts; both are guarded by an internal mutex.
/// Class abbreviation: sh
class SecurityHeuristics {
 public:
  explicit SecurityHeuristics(const common::SessionPolicy& spPolicy);
  ~SecurityHeuristics();

  /// Records this creation and flags it when either
  ///  (a) more than the configured threshold of sessions were created for the
  ///      user inside the trailing window, or
  ///  (b) vPriorActive is non-empty and none of them shares sIpAddress's
  ///      network prefix.
  /// Always returns a clean verdict when detection is disabled.
  HeuristicVerdict detectAtCreation(const std::string& sUserId, const std::string& sIpAddress,
                                    const std::string& sDeviceId,
                                    const std::vector<common::SessionRecord>& vPriorActive,
                                    common::TimePoint tpNow);

  /// True when detection is enabled, an IP was supplied and it differs from
  /// the one stored on the record.
  bool ipChanged(const common::SessionRecord& rec,
                 const std::optional<std::string>& oIpAddress) const;

  bool enabled() const { return _bEnabled; }

  int64_t suspiciousCount(const std::string& sUserId) const;
  int64_t totalSuspicious() const;

  /// Drop creation history older than the window. Called by the janitor.
  void pruneHistory(common::TimePoint tpNow);

  /// IPv4: first two octets ("10.1"). IPv6: first two hextets, lowercased.
  static std::string networkPrefix(const std::string& sIpAddress);

 private:
  bool _bEnabled;
  int _iRapidThreshold;
  std::chrono::seconds _durWindow;

  mutable std::mutex _mtx;
  std::unordered_map<std::string, std::deque<common::TimePoint>> _mCreations;
  std::unordered_map<std::string, int64_t> _mSuspicious;
};

}  // namespace sguard::security
