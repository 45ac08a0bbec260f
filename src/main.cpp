#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <pthread.h>

#include "common/Config.hpp"
#include "common/Logger.hpp"
#include "core/Clock.hpp"
#include "core/MaintenanceScheduler.hpp"
#include "core/SessionJanitor.hpp"
#include "core/SessionLifecycleService.hpp"
#include "dal/ConnectionPool.hpp"
#include "dal/PgSecurityEventSink.hpp"
#include "dal/PgSessionStore.hpp"
#include "dal/SessionRecordStore.hpp"
#include "security/ISecurityEventSink.hpp"
#include "security/LogSecurityEventSink.hpp"
#include "security/SecurityEventLog.hpp"
#include "security/SecurityHeuristics.hpp"

namespace {

/// Block SIGINT/SIGTERM in every thread, so the ones spawned below inherit
/// the mask and only sigwait() in main sees them.
sigset_t blockShutdownSignals() {
  sigset_t ssSignals;
  sigemptyset(&ssSignals);
  sigaddset(&ssSignals, SIGINT);
  sigaddset(&ssSignals, SIGTERM);
  const int iRc = pthread_sigmask(SIG_BLOCK, &ssSignals, nullptr);
  if (iRc != 0) {
    throw std::runtime_error("pthread_sigmask failed: " + std::to_string(iRc));
  }
  return ssSignals;
}

}  // namespace

int main() {
  try {
    const sigset_t ssShutdown = blockShutdownSignals();

    // ── Step 1: Load and validate configuration ──────────────────────────
    const auto cfgApp = sguard::common::Config::load();

    sguard::common::Logger::init(cfgApp.sLogLevel);
    auto spLog = sguard::common::Logger::get();
    spLog->info("Step 1: Configuration loaded (maxSessions={}, timeout={}m, extended={}m, "
                "inactivity={}m)",
                cfgApp.spPolicy.iMaxSessions, cfgApp.spPolicy.iSessionTimeoutMinutes,
                cfgApp.spPolicy.iExtendedSessionTimeoutMinutes,
                cfgApp.spPolicy.iInactivityTimeoutMinutes);

    // ── Step 2: Initialize ConnectionPool ────────────────────────────────
    auto cpPool = std::make_unique<sguard::dal::ConnectionPool>(cfgApp.sDbUrl,
                                                                cfgApp.iDbPoolSize);
    spLog->info("Step 2: ConnectionPool initialized (size={})", cfgApp.iDbPoolSize);

    // ── Step 3: Durable tiers ────────────────────────────────────────────
    auto pssDurable = std::make_unique<sguard::dal::PgSessionStore>(*cpPool);
    std::unique_ptr<sguard::security::ISecurityEventSink> upSink;
    if (cfgApp.bSecurityEventsStdout) {
      upSink = std::make_unique<sguard::security::LogSecurityEventSink>();
    } else {
      upSink = std::make_unique<sguard::dal::PgSecurityEventSink>(*cpPool);
    }
    spLog->info("Step 3: Durable session store ready (security events -> {})",
                cfgApp.bSecurityEventsStdout ? "log" : "postgres");

    // ── Step 4: Session lifecycle ────────────────────────────────────────
    sguard::core::SystemClock clkSystem;
    auto selEvents = std::make_unique<sguard::security::SecurityEventLog>(*upSink);
    auto srsStore = std::make_unique<sguard::dal::SessionRecordStore>(*pssDurable);
    auto shHeuristics = std::make_unique<sguard::security::SecurityHeuristics>(cfgApp.spPolicy);
    auto slsService = std::make_unique<sguard::core::SessionLifecycleService>(
        cfgApp.spPolicy, *srsStore, *shHeuristics, *selEvents, clkSystem);
    spLog->info("Step 4: SessionLifecycleService ready");

    // ── Step 5: Janitor ──────────────────────────────────────────────────
    auto sjJanitor =
        std::make_unique<sguard::core::SessionJanitor>(*srsStore, *shHeuristics, clkSystem);
    auto msScheduler = std::make_unique<sguard::core::MaintenanceScheduler>();
    sjJanitor->attach(*msScheduler, cfgApp.iJanitorIntervalSeconds);
    msScheduler->start();
    spLog->info("Step 5: MaintenanceScheduler started (session sweep every {}s)",
                cfgApp.iJanitorIntervalSeconds);

    spLog->info("session-guard ready");

    int iSignal = 0;
    const int iRc = sigwait(&ssShutdown, &iSignal);
    if (iRc != 0) {
      throw std::runtime_error("sigwait failed: " + std::to_string(iRc));
    }
    spLog->info("Received signal {}; shutting down", iSignal);

    // Graceful shutdown
    msScheduler->stop();
    spLog->info("MaintenanceScheduler stopped");

    const auto stFinal = slsService->getSessionStatistics();
    slsService.reset();
    srsStore->flush();
    selEvents->flush();
    spLog->info("Write-behind queues drained ({} active session(s) across {} user(s), "
                "{} persistence failure(s), {} dropped event(s))",
                stFinal.iActiveSessions, stFinal.iTotalUsers, srsStore->persistenceFailures(),
                selEvents->failedCount());

    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    std::cerr << "[fatal] session-guard failed: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
}
