#pragma once

#include <atomic>
#include <cstdint>
#include <optional>

namespace sguard::dal {
class SessionRecordStore;
}  // namespace sguard::dal

namespace sguard::security {
class SecurityHeuristics;
}  // namespace sguard::security

namespace sguard::core {

class IClock;
class MaintenanceScheduler;

/// What one sweep did.
/// Class abbreviation: jr
struct JanitorReport {
  bool bRan = false;                   // false when another sweep was in flight
  int iEvicted = 0;                    // cache entries dropped
  std::optional<int> oDeactivated;     // durable rows flipped; nullopt on failure
  int iRetried = 0;                    // failed deactivations re-queued
};

/// Periodic cleanup of expired and inactive sessions in both tiers.
/// Sweeps never overlap; a sweep requested while one runs is skipped and counted.
/// Class abbreviation: sj
class SessionJanitor {
 public:
  SessionJanitor(dal::SessionRecordStore& srsStore, security::SecurityHeuristics& shHeuristics,
                 const IClock& clkClock);
  ~SessionJanitor();

  JanitorReport sweep();

  /// Register sweep() on the scheduler; first run one interval from now.
  void attach(MaintenanceScheduler& msScheduler, int iIntervalSeconds);

  int64_t sweepCount() const { return _iSweeps.load(); }
  int64_t skippedSweeps() const { return _iSkipped.load(); }

 private:
  dal::SessionRecordStore& _srsStore;
  security::SecurityHeuristics& _shHeuristics;
  const IClock& _clkClock;

  std::atomic<bool> _bSweeping{false};
  std::atomic<int64_t> _iSweeps{0};
  std::atomic<int64_t> _iSkipped{0};
};

}  // namespace sguard::core
