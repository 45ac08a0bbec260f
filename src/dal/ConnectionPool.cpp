#include "dal/ConnectionPool.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <string>
#include <utility>

namespace sguard::dal {

// ── ConnectionGuard ────────────────────────────────────────────────────────

ConnectionGuard::ConnectionGuard(ConnectionPool& cpPool,
                                 std::shared_ptr<pqxx::connection> spConn)
    : _pPool(&cpPool), _spConn(std::move(spConn)) {}

ConnectionGuard::~ConnectionGuard() {
  if (_spConn && _pPool) {
    _pPool->returnConnection(std::move(_spConn));
  }
}

ConnectionGuard::ConnectionGuard(ConnectionGuard&& other) noexcept
    : _pPool(other._pPool), _spConn(std::move(other._spConn)) {
  other._pPool = nullptr;
}

ConnectionGuard& ConnectionGuard::operator=(ConnectionGuard&& other) noexcept {
  if (this != &other) {
    if (_spConn && _pPool) {
      _pPool->returnConnection(std::move(_spConn));
    }
    _pPool = other._pPool;
    _spConn = std::move(other._spConn);
    other._pPool = nullptr;
  }
  return *this;
}

pqxx::connection& ConnectionGuard::operator*() { return *_spConn; }
pqxx::connection* ConnectionGuard::operator->() { return _spConn.get(); }

// ── ConnectionPool ─────────────────────────────────────────────────────────

ConnectionPool::ConnectionPool(const std::string& sDbUrl, int iPoolSize,
                               std::chrono::milliseconds durCheckoutTimeout)
    : _sDbUrl(sDbUrl), _iPoolSize(iPoolSize), _durCheckoutTimeout(durCheckoutTimeout) {
  auto spLog = common::Logger::get();
  // Never log credentials: keep only what follows the '@'
  const auto nAt = _sDbUrl.find('@');
  spLog->info("Opening session store pool: size={}, host={}", _iPoolSize,
              nAt == std::string::npos ? std::string("<local>") : _sDbUrl.substr(nAt + 1));

  _vIdle.reserve(static_cast<size_t>(_iPoolSize));
  for (int i = 0; i < _iPoolSize; ++i) {
    _vIdle.push_back(open());
  }
}

ConnectionPool::~ConnectionPool() {
  std::lock_guard<std::mutex> lock(_mtx);
  _vIdle.clear();
}

std::shared_ptr<pqxx::connection> ConnectionPool::open() {
  std::shared_ptr<pqxx::connection> spConn;
  try {
    spConn = std::make_shared<pqxx::connection>(_sDbUrl);
  } catch (const pqxx::broken_connection& ex) {
    throw common::PersistenceError("db_unavailable",
                                   std::string("Failed to open database connection: ") +
                                       ex.what());
  }
  if (!spConn->is_open()) {
    throw common::PersistenceError("db_unavailable", "Failed to open database connection");
  }
  return spConn;
}

ConnectionGuard ConnectionPool::checkout() {
  std::unique_lock<std::mutex> lock(_mtx);

  const bool bAvailable =
      _cv.wait_for(lock, _durCheckoutTimeout, [this] { return !_vIdle.empty(); });
  if (!bAvailable) {
    throw common::PersistenceError("pool_exhausted",
                                   "Timed out waiting for a database connection");
  }

  auto spConn = std::move(_vIdle.back());
  _vIdle.pop_back();
  lock.unlock();

  if (!ping(*spConn)) {
    common::Logger::get()->warn("Stale database connection, reconnecting");
    try {
      spConn = open();
    } catch (const std::exception&) {
      // Keep the slot: hand back the dead connection so the pool size holds
      returnConnection(std::move(spConn));
      throw;
    }
  }

  return ConnectionGuard(*this, std::move(spConn));
}

void ConnectionPool::returnConnection(std::shared_ptr<pqxx::connection> spConn) {
  {
    std::lock_guard<std::mutex> lock(_mtx);
    _vIdle.push_back(std::move(spConn));
  }
  _cv.notify_one();
}

bool ConnectionPool::ping(pqxx::connection& conn) {
  try {
    pqxx::nontransaction ntx(conn);
    ntx.exec("SELECT 1");
    return true;
  } catch (const pqxx::failure&) {
    return false;
  }
}

}  // namespace sguard::dal
