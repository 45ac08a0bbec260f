#include "core/MaintenanceScheduler.hpp"

#include "common/Logger.hpp"

#include <algorithm>
#include <stdexcept>

namespace sguard::core {

MaintenanceScheduler::MaintenanceScheduler() = default;

MaintenanceScheduler::~MaintenanceScheduler() {
  stop();
}

void MaintenanceScheduler::schedule(const std::string& sName,
                                    std::chrono::milliseconds durInterval,
                                    std::function<void()> fnTask, FirstRun frFirst) {
  if (durInterval <= std::chrono::milliseconds::zero()) {
    throw std::invalid_argument("MaintenanceScheduler: interval for '" + sName +
                                "' must be positive");
  }

  std::lock_guard<std::mutex> lock(_mtx);
  auto tpFirst = std::chrono::steady_clock::now();
  if (frFirst == FirstRun::AfterInterval) {
    tpFirst += durInterval;
  }
  _vTasks.push_back(Task{sName, durInterval, std::move(fnTask), tpFirst});
}

void MaintenanceScheduler::runDue(std::chrono::steady_clock::time_point tpNow) {
  auto spLog = common::Logger::get();

  for (auto& task : _vTasks) {
    if (tpNow < task.tpNextRun) continue;

    const auto tpStarted = std::chrono::steady_clock::now();
    try {
      task.fn();
    } catch (const std::exception& ex) {
      spLog->error("MaintenanceScheduler: task '{}' failed: {}", task.sName, ex.what());
    }
    const auto tpFinished = std::chrono::steady_clock::now();

    // Ticks that fell due while the task was still running are dropped
    const auto iMissed = (tpFinished - tpStarted) / task.durInterval;
    if (iMissed > 0) {
      _iSkippedTicks.fetch_add(static_cast<int64_t>(iMissed));
      spLog->warn("MaintenanceScheduler: task '{}' overran its interval, skipped {} tick(s)",
                  task.sName, static_cast<int64_t>(iMissed));
    }
    task.tpNextRun = tpFinished + task.durInterval;
  }
}

void MaintenanceScheduler::start() {
  std::lock_guard<std::mutex> lock(_mtx);
  if (_bRunning) return;
  _bRunning = true;

  _thread = std::jthread([this](std::stop_token stToken) {
    while (!stToken.stop_requested()) {
      runDue(std::chrono::steady_clock::now());

      // Find the next scheduled run time
      auto tpNextWake = std::chrono::steady_clock::now() + std::chrono::hours(1);
      for (const auto& task : _vTasks) {
        tpNextWake = std::min(tpNextWake, task.tpNextRun);
      }

      // Sleep until next task is due, or until stop is requested
      std::unique_lock<std::mutex> ulock(_mtx);
      _cv.wait_until(ulock, tpNextWake, [&stToken]() { return stToken.stop_requested(); });
    }
  });
}

void MaintenanceScheduler::stop() {
  {
    std::lock_guard<std::mutex> lock(_mtx);
    if (!_bRunning) return;
    _bRunning = false;
    // Under the lock so the worker cannot miss it between check and wait
    _thread.request_stop();
  }
  _cv.notify_all();

  if (_thread.joinable()) {
    _thread.join();
  }
}

}  // namespace sguard::core
