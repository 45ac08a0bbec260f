#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <pqxx/pqxx>

namespace sguard::dal {

class ConnectionPool;

/// RAII guard for a checked-out connection; returns it on destruction.
/// Class abbreviation: cg
class ConnectionGuard {
 public:
  ConnectionGuard(ConnectionPool& cpPool, std::shared_ptr<pqxx::connection> spConn);
  ~ConnectionGuard();

  ConnectionGuard(const ConnectionGuard&) = delete;
  ConnectionGuard& operator=(const ConnectionGuard&) = delete;
  ConnectionGuard(ConnectionGuard&& other) noexcept;
  ConnectionGuard& operator=(ConnectionGuard&& other) noexcept;

  pqxx::connection& operator*();
  pqxx::connection* operator->();

 private:
  ConnectionPool* _pPool;
  std::shared_ptr<pqxx::connection> _spConn;
};

/// Fixed-size pool of pqxx::connection objects shared by the session store
/// and the security event sink.
/// Class abbreviation: cp
class ConnectionPool {
 public:
  ConnectionPool(const std::string& sDbUrl, int iPoolSize,
                 std::chrono::milliseconds durCheckoutTimeout = std::chrono::seconds(5));
  ~ConnectionPool();

  /// Check out a connection, waiting up to the checkout timeout.
  /// Throws common::PersistenceError when the pool stays exhausted or a
  /// stale connection cannot be reopened.
  ConnectionGuard checkout();

  /// Called by ConnectionGuard's destructor.
  void returnConnection(std::shared_ptr<pqxx::connection> spConn);

  int size() const { return _iPoolSize; }

 private:
  bool ping(pqxx::connection& conn);
  std::shared_ptr<pqxx::connection> open();

  std::vector<std::shared_ptr<pqxx::connection>> _vIdle;
  std::mutex _mtx;
  std::condition_variable _cv;
  std::string _sDbUrl;
  int _iPoolSize;
  std::chrono::milliseconds _durCheckoutTimeout;
};

}  // namespace sguard::dal
