#include "dal/SessionRecordStore.hpp"

#include "common/Logger.hpp"
#include "dal/ISessionStore.hpp"

#include <algorithm>
#include <mutex>
#include <utility>

namespace sguard::dal {

SessionRecordStore::SessionRecordStore(ISessionStore& ssDurable)
    : _ssDurable(ssDurable), _tpWriter("session-write-behind", 1) {}

SessionRecordStore::~SessionRecordStore() {
  // Drain queued writes while every member they touch is still alive
  _tpWriter.shutdown();
}

// ── Write-behind ───────────────────────────────────────────────────────────

bool SessionRecordStore::writeBehindAttempt(const std::string& sOperation,
                                            const std::string& sKey,
                                            const std::function<void()>& fnWrite) {
  try {
    fnWrite();
    return true;
  } catch (const std::exception& ex) {
    _iPersistFailures.fetch_add(1);
    common::Logger::get()->warn("Durable {} for {} failed: {}", sOperation, sKey, ex.what());
    return false;
  }
}

void SessionRecordStore::writeBehind(const std::string& sOperation, const std::string& sKey,
                                     std::function<void()> fnWrite) {
  const bool bQueued = _tpWriter.post([this, sOperation, sKey, fnWrite = std::move(fnWrite)]() {
    writeBehindAttempt(sOperation, sKey, fnWrite);
  });
  if (!bQueued) {
    _iPersistFailures.fetch_add(1);
    common::Logger::get()->warn("Durable {} for {} dropped: store is shutting down",
                                sOperation, sKey);
  }
}

void SessionRecordStore::queueDeactivation(const std::string& sSessionId) {
  const bool bQueued = _tpWriter.post([this, sSessionId]() {
    common::SessionFieldUpdate upd;
    upd.oIsActive = false;
    const bool bOk = writeBehindAttempt("deactivate", sSessionId, [&]() {
      _ssDurable.updateFields(sSessionId, upd);
    });

    std::unique_lock lock(_smtx);
    if (bOk) {
      _sPendingDeactivation.erase(sSessionId);
      _mTombstones.erase(sSessionId);
    } else {
      _sFailedDeactivation.insert(sSessionId);
    }
  });
  if (!bQueued) {
    _iPersistFailures.fetch_add(1);
    common::Logger::get()->warn("Durable deactivate for {} dropped: store is shutting down",
                                sSessionId);
    std::unique_lock lock(_smtx);
    _sFailedDeactivation.insert(sSessionId);
  }
}

// ── User index ─────────────────────────────────────────────────────────────

void SessionRecordStore::indexInsert(const common::SessionRecord& rec) {
  _mUserIndex[rec.sUserId].insert(rec.sSessionId);
}

void SessionRecordStore::indexErase(const common::SessionRecord& rec) {
  auto it = _mUserIndex.find(rec.sUserId);
  if (it == _mUserIndex.end()) return;
  it->second.erase(rec.sSessionId);
  if (it->second.empty()) {
    _mUserIndex.erase(it);
  }
}

// ── Record operations ──────────────────────────────────────────────────────

void SessionRecordStore::create(const common::SessionRecord& rec) {
  {
    std::unique_lock lock(_smtx);
    auto [it, bInserted] = _mCache.insert_or_assign(rec.sSessionId, rec);
    indexInsert(it->second);
  }

  writeBehind("upsert", rec.sSessionId, [this, rec]() { _ssDurable.upsert(rec); });
}

std::optional<common::SessionRecord> SessionRecordStore::get(const std::string& sSessionId) {
  {
    std::shared_lock lock(_smtx);
    if (auto it = _mCache.find(sSessionId); it != _mCache.end()) {
      return it->second;
    }
    if (auto it = _mTombstones.find(sSessionId); it != _mTombstones.end()) {
      return it->second;
    }
  }

  std::optional<common::SessionRecord> oRec;
  try {
    oRec = _ssDurable.findById(sSessionId);
  } catch (const std::exception& ex) {
    _iPersistFailures.fetch_add(1);
    common::Logger::get()->warn("Durable read-through for session {} failed: {}",
                                sSessionId, ex.what());
    return std::nullopt;
  }
  if (!oRec.has_value()) {
    return std::nullopt;
  }

  // Re-check under the write lock: a terminate may have raced the read
  std::unique_lock lock(_smtx);
  if (auto it = _mCache.find(sSessionId); it != _mCache.end()) {
    return it->second;
  }
  if (auto it = _mTombstones.find(sSessionId); it != _mTombstones.end()) {
    return it->second;
  }
  if (_sPendingDeactivation.count(sSessionId) > 0) {
    oRec->bIsActive = false;
  }
  if (oRec->bIsActive) {
    auto [it, bInserted] = _mCache.emplace(sSessionId, *oRec);
    indexInsert(it->second);
    common::Logger::get()->debug("Session {} repopulated from durable store", sSessionId);
  }
  return oRec;
}

std::optional<common::SessionRecord> SessionRecordStore::updateFields(
    const std::string& sSessionId, const common::SessionFieldUpdate& updFields) {
  std::optional<common::SessionRecord> oUpdated;
  {
    std::unique_lock lock(_smtx);
    if (auto it = _mCache.find(sSessionId); it != _mCache.end()) {
      auto& rec = it->second;
      if (updFields.oLastActivity.has_value()) {
        rec.tpLastActivity = std::max(rec.tpLastActivity, *updFields.oLastActivity);
      }
      if (updFields.oIsActive.has_value() && !*updFields.oIsActive) {
        rec.bIsActive = false;
      }
      if (updFields.oFlags.has_value()) {
        rec.sfFlags = *updFields.oFlags;
      }
      oUpdated = rec;
    }
  }

  writeBehind("update", sSessionId,
              [this, sSessionId, updFields]() { _ssDurable.updateFields(sSessionId, updFields); });
  return oUpdated;
}

std::optional<common::SessionRecord> SessionRecordStore::markInactive(
    const std::string& sSessionId) {
  std::optional<common::SessionRecord> oPrevious;
  bool bNewlyPending = false;
  {
    std::unique_lock lock(_smtx);
    if (auto it = _mCache.find(sSessionId); it != _mCache.end()) {
      if (it->second.bIsActive) {
        oPrevious = it->second;
      }
      it->second.bIsActive = false;
      _mTombstones.insert_or_assign(sSessionId, it->second);
    }
    bNewlyPending = _sPendingDeactivation.insert(sSessionId).second;
  }

  if (bNewlyPending) {
    queueDeactivation(sSessionId);
  }
  return oPrevious;
}

void SessionRecordStore::evict(const std::string& sSessionId) {
  std::unique_lock lock(_smtx);
  auto it = _mCache.find(sSessionId);
  if (it == _mCache.end()) return;
  indexErase(it->second);
  _mCache.erase(it);
}

std::vector<common::SessionRecord> SessionRecordStore::listActiveByUser(
    const std::string& sUserId) {
  std::vector<common::SessionRecord> vResult;
  std::unordered_set<std::string> sSkip;
  {
    std::shared_lock lock(_smtx);
    if (auto itIdx = _mUserIndex.find(sUserId); itIdx != _mUserIndex.end()) {
      for (const auto& sId : itIdx->second) {
        const auto& rec = _mCache.at(sId);
        sSkip.insert(sId);  // cache wins even when its copy is inactive
        if (rec.bIsActive) {
          vResult.push_back(rec);
        }
      }
    }
    for (const auto& [sId, rec] : _mTombstones) {
      sSkip.insert(sId);
    }
    sSkip.insert(_sPendingDeactivation.begin(), _sPendingDeactivation.end());
  }

  std::vector<common::SessionRecord> vDurable;
  try {
    vDurable = _ssDurable.findActiveByUser(sUserId);
  } catch (const std::exception& ex) {
    _iPersistFailures.fetch_add(1);
    common::Logger::get()->warn("Durable listing for user {} failed, using cache only: {}",
                                sUserId, ex.what());
    return vResult;
  }

  for (auto& rec : vDurable) {
    if (!rec.bIsActive || !sSkip.insert(rec.sSessionId).second) continue;
    vResult.push_back(std::move(rec));
  }
  return vResult;
}

std::vector<common::SessionRecord> SessionRecordStore::cachedActiveByUser(
    const std::string& sUserId) const {
  std::vector<common::SessionRecord> vResult;
  std::shared_lock lock(_smtx);
  auto itIdx = _mUserIndex.find(sUserId);
  if (itIdx == _mUserIndex.end()) return vResult;
  for (const auto& sId : itIdx->second) {
    const auto& rec = _mCache.at(sId);
    if (rec.bIsActive) {
      vResult.push_back(rec);
    }
  }
  return vResult;
}

std::vector<common::SessionRecord> SessionRecordStore::snapshot() const {
  std::shared_lock lock(_smtx);
  std::vector<common::SessionRecord> vResult;
  vResult.reserve(_mCache.size());
  for (const auto& [sId, rec] : _mCache) {
    vResult.push_back(rec);
  }
  return vResult;
}

// ── Janitor support ────────────────────────────────────────────────────────

int SessionRecordStore::evictStale(common::TimePoint tpNow) {
  std::unique_lock lock(_smtx);
  int iEvicted = 0;
  for (auto it = _mCache.begin(); it != _mCache.end();) {
    if (!it->second.bIsActive || it->second.tpExpiresAt < tpNow) {
      indexErase(it->second);
      it = _mCache.erase(it);
      ++iEvicted;
    } else {
      ++it;
    }
  }

  // An expired record is covered by the bulk durable deactivation
  for (auto it = _mTombstones.begin(); it != _mTombstones.end();) {
    if (it->second.tpExpiresAt < tpNow) {
      _sPendingDeactivation.erase(it->first);
      _sFailedDeactivation.erase(it->first);
      it = _mTombstones.erase(it);
    } else {
      ++it;
    }
  }

  std::unordered_set<std::string> sLiveDevices;
  for (const auto& [sId, rec] : _mCache) {
    sLiveDevices.insert(rec.sDeviceId);
  }
  std::erase_if(_mFingerprints,
                [&](const auto& kv) { return sLiveDevices.count(kv.first) == 0; });

  return iEvicted;
}

std::optional<int> SessionRecordStore::deactivateExpired(common::TimePoint tpNow) {
  try {
    return _ssDurable.bulkDeactivateExpired(tpNow);
  } catch (const std::exception& ex) {
    _iPersistFailures.fetch_add(1);
    common::Logger::get()->error("Durable bulk deactivation of expired sessions failed: {}",
                                 ex.what());
    return std::nullopt;
  }
}

int SessionRecordStore::retryFailedDeactivations() {
  std::vector<std::string> vRetry;
  {
    std::unique_lock lock(_smtx);
    vRetry.assign(_sFailedDeactivation.begin(), _sFailedDeactivation.end());
    _sFailedDeactivation.clear();
  }
  for (const auto& sId : vRetry) {
    queueDeactivation(sId);
  }
  return static_cast<int>(vRetry.size());
}

void SessionRecordStore::deactivateAllForUser(
    const std::string& sUserId, const std::optional<std::string>& oExceptSessionId) {
  writeBehind("deactivate-all", "user " + sUserId, [this, sUserId, oExceptSessionId]() {
    _ssDurable.deactivateAllForUser(sUserId, oExceptSessionId);
  });
}

// ── Fingerprints ───────────────────────────────────────────────────────────

void SessionRecordStore::rememberFingerprint(const std::string& sDeviceId,
                                             const common::DeviceFingerprint& dfp) {
  std::unique_lock lock(_smtx);
  _mFingerprints.insert_or_assign(sDeviceId, dfp);
}

std::optional<common::DeviceFingerprint> SessionRecordStore::findFingerprint(
    const std::string& sDeviceId) const {
  std::shared_lock lock(_smtx);
  auto it = _mFingerprints.find(sDeviceId);
  if (it == _mFingerprints.end()) return std::nullopt;
  return it->second;
}

// ── Introspection ──────────────────────────────────────────────────────────

void SessionRecordStore::flush() {
  _tpWriter.waitIdle();
}

size_t SessionRecordStore::cacheSize() const {
  std::shared_lock lock(_smtx);
  return _mCache.size();
}

size_t SessionRecordStore::tombstoneCount() const {
  std::shared_lock lock(_smtx);
  return _mTombstones.size();
}

size_t SessionRecordStore::pendingDeactivationCount() const {
  std::shared_lock lock(_smtx);
  return _sPendingDeactivation.size();
}

}  // namespace sguard::dal
