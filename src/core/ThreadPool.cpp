#include "core/ThreadPool.hpp"

#include "common/Logger.hpp"

#include <stdexcept>
#include <utility>

namespace sguard::core {

ThreadPool::ThreadPool(std::string sName, int iSize) : _sName(std::move(sName)) {
  if (iSize < 1) {
    throw std::invalid_argument("ThreadPool '" + _sName + "' needs at least one worker");
  }
  _vWorkers.reserve(static_cast<size_t>(iSize));
  for (int i = 0; i < iSize; ++i) {
    _vWorkers.emplace_back([this]() { workerLoop(); });
  }
}

ThreadPool::~ThreadPool() {
  shutdown();
}

bool ThreadPool::post(std::function<void()> fnTask) {
  {
    std::lock_guard<std::mutex> lock(_mtx);
    if (_bStopping) return false;
    _qTasks.push(std::move(fnTask));
  }
  _cvWork.notify_one();
  return true;
}

void ThreadPool::waitIdle() {
  std::unique_lock<std::mutex> lock(_mtx);
  _cvIdle.wait(lock, [this]() { return _qTasks.empty() && _iBusy == 0; });
}

void ThreadPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock(_mtx);
    if (_bStopping) return;
    _bStopping = true;
  }
  _cvWork.notify_all();

  for (auto& worker : _vWorkers) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

size_t ThreadPool::pending() const {
  std::lock_guard<std::mutex> lock(_mtx);
  return _qTasks.size();
}

void ThreadPool::workerLoop() {
  for (;;) {
    std::function<void()> fnTask;
    {
      std::unique_lock<std::mutex> lock(_mtx);
      _cvWork.wait(lock, [this]() { return _bStopping || !_qTasks.empty(); });
      if (_qTasks.empty()) {
        return;  // stopping and drained
      }
      fnTask = std::move(_qTasks.front());
      _qTasks.pop();
      ++_iBusy;
    }

    try {
      fnTask();
    } catch (const std::exception& ex) {
      common::Logger::get()->error("ThreadPool '{}': task failed: {}", _sName, ex.what());
    } catch (...) {
      common::Logger::get()->error("ThreadPool '{}': task failed: unknown exception", _sName);
    }

    {
      std::lock_guard<std::mutex> lock(_mtx);
      --_iBusy;
      if (_qTasks.empty() && _iBusy == 0) {
        _cvIdle.notify_all();
      }
    }
  }
}

}  // namespace sguard::core
