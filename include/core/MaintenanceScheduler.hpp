#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace sguard::core {

/// Runs periodic background tasks on configurable intervals.
///
/// Tasks run one at a time on a single thread, so a run that has not finished
/// suppresses every tick that falls due meanwhile: the next run is scheduled
/// one interval after completion, and missed ticks are counted, not replayed.
/// Class abbreviation: ms
class MaintenanceScheduler {
 public:
  enum class FirstRun { Immediately, AfterInterval };

  MaintenanceScheduler();
  ~MaintenanceScheduler();

  MaintenanceScheduler(const MaintenanceScheduler&) = delete;
  MaintenanceScheduler& operator=(const MaintenanceScheduler&) = delete;

  /// Must be called before start().
  void schedule(const std::string& sName, std::chrono::milliseconds durInterval,
                std::function<void()> fnTask, FirstRun frFirst = FirstRun::AfterInterval);
  void start();
  void stop();

  int64_t skippedTicks() const { return _iSkippedTicks.load(); }

 private:
  struct Task {
    std::string sName;
    std::chrono::milliseconds durInterval;
    std::function<void()> fn;
    std::chrono::steady_clock::time_point tpNextRun;
  };

  void runDue(std::chrono::steady_clock::time_point tpNow);

  std::vector<Task> _vTasks;
  std::jthread _thread;
  std::mutex _mtx;
  std::condition_variable _cv;
  bool _bRunning = false;
  std::atomic<int64_t> _iSkippedTicks{0};
};

}  // namespace sguard::core
