#include "core/SessionJanitor.hpp"

#include "common/Logger.hpp"
#include "core/Clock.hpp"
#include "core/MaintenanceScheduler.hpp"
#include "dal/SessionRecordStore.hpp"
#include "security/SecurityHeuristics.hpp"

#include <chrono>
#include <string>

namespace sguard::core {

namespace {

/// Clears the in-flight flag on every exit path.
class SweepGuard {
 public:
  explicit SweepGuard(std::atomic<bool>& bFlag) : _bFlag(bFlag) {}
  ~SweepGuard() { _bFlag.store(false); }

  SweepGuard(const SweepGuard&) = delete;
  SweepGuard& operator=(const SweepGuard&) = delete;

 private:
  std::atomic<bool>& _bFlag;
};

}  // namespace

SessionJanitor::SessionJanitor(dal::SessionRecordStore& srsStore,
                               security::SecurityHeuristics& shHeuristics,
                               const IClock& clkClock)
    : _srsStore(srsStore), _shHeuristics(shHeuristics), _clkClock(clkClock) {}

SessionJanitor::~SessionJanitor() = default;

JanitorReport SessionJanitor::sweep() {
  JanitorReport jr;

  bool bExpected = false;
  if (!_bSweeping.compare_exchange_strong(bExpected, true)) {
    _iSkipped.fetch_add(1);
    common::Logger::get()->debug("Session sweep already in progress; skipping");
    return jr;
  }
  SweepGuard guard(_bSweeping);

  const auto tpNow = _clkClock.now();
  jr.bRan = true;
  jr.iEvicted = _srsStore.evictStale(tpNow);
  jr.oDeactivated = _srsStore.deactivateExpired(tpNow);
  _shHeuristics.pruneHistory(tpNow);
  jr.iRetried = _srsStore.retryFailedDeactivations();
  _iSweeps.fetch_add(1);

  auto spLog = common::Logger::get();
  if (jr.iEvicted > 0 || jr.oDeactivated.value_or(0) > 0 || jr.iRetried > 0) {
    spLog->info("Session sweep: evicted {}, deactivated {}, retried {}", jr.iEvicted,
                jr.oDeactivated.has_value() ? std::to_string(*jr.oDeactivated) : "n/a",
                jr.iRetried);
  } else {
    spLog->debug("Session sweep: nothing to do");
  }
  return jr;
}

void SessionJanitor::attach(MaintenanceScheduler& msScheduler, int iIntervalSeconds) {
  msScheduler.schedule("session-janitor", std::chrono::seconds(iIntervalSeconds),
                       [this]() { sweep(); });
}

}  // namespace sguard::core
