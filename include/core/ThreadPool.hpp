#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace sguard::core {

/// Fixed-size pool of std::jthread workers for fire-and-forget work.
/// With a single worker, tasks run strictly in submission order.
/// Exceptions escaping a task are logged and dropped.
/// Class abbreviation: tp
class ThreadPool {
 public:
  ThreadPool(std::string sName, int iSize);
  ~ThreadPool();

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  /// Queue a task. Returns false (and drops the task) after shutdown().
  bool post(std::function<void()> fnTask);

  /// Block until the queue is empty and no task is running.
  void waitIdle();

  /// Run everything already queued, then join the workers. Idempotent.
  void shutdown();

  size_t pending() const;

 private:
  void workerLoop();

  std::string _sName;
  std::vector<std::jthread> _vWorkers;
  std::queue<std::function<void()>> _qTasks;
  mutable std::mutex _mtx;
  std::condition_variable _cvWork;
  std::condition_variable _cvIdle;
  int _iBusy = 0;
  bool _bStopping = false;
};

}  // namespace sguard::core
