#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "common/Types.hpp"
#include "core/ThreadPool.hpp"

namespace sguard::dal {

class ISessionStore;

/// Two-tier session storage: an authoritative in-process cache in front of an
/// ISessionStore.
///
/// Writes land in the cache synchronously and are forwarded to the durable
/// tier by a single write-behind worker (FIFO, so a record's upsert always
/// precedes its later updates). Durable failures are logged and counted,
/// never returned. Reads are cache-first with one read-through on a miss.
///
/// Staleness window: until the write-behind queue drains, the durable tier
/// may lag the cache. An id passed to markInactive() is held as pending until
/// the durable tier acknowledges the deactivation; durable reads of a pending
/// id are forced inactive, so a read-through can never bring a terminated
/// session back. Cached records that are deactivated also leave a tombstone
/// copy, answered without touching the durable tier, until the ack arrives
/// or the record expires.
/// Class abbreviation: srs
class SessionRecordStore {
 public:
  explicit SessionRecordStore(ISessionStore& ssDurable);
  ~SessionRecordStore();

  SessionRecordStore(const SessionRecordStore&) = delete;
  SessionRecordStore& operator=(const SessionRecordStore&) = delete;

  /// Cache the record; upsert it durably in the background.
  void create(const common::SessionRecord& rec);

  /// Cache, then tombstones, then one durable read-through. Active records
  /// found durably are cached; inactive ones are returned but not cached.
  std::optional<common::SessionRecord> get(const std::string& sSessionId);

  /// Apply to the cached record if present (lastActivity never moves back,
  /// isActive never returns to true) and forward to the durable tier.
  /// Returns the updated cached record, if there was one.
  std::optional<common::SessionRecord> updateFields(const std::string& sSessionId,
                                                    const common::SessionFieldUpdate& updFields);

  /// Idempotent. Flips the cached copy (if any) to inactive, tombstones it,
  /// marks the id pending and queues the durable deactivation. Returns the
  /// record as it was before the call when it was cached and still active.
  std::optional<common::SessionRecord> markInactive(const std::string& sSessionId);

  /// Drop the id from the active cache. Tombstones are kept.
  void evict(const std::string& sSessionId);

  /// Cache ∪ durable active records for a user, de-duplicated by id with the
  /// cache winning. Tombstoned and pending ids are excluded. A durable
  /// failure degrades to the cache-only view.
  std::vector<common::SessionRecord> listActiveByUser(const std::string& sUserId);

  /// Active records for a user held in the cache only.
  std::vector<common::SessionRecord> cachedActiveByUser(const std::string& sUserId) const;

  /// Copy of every cached record.
  std::vector<common::SessionRecord> snapshot() const;

  /// Janitor pass over the cache: evict records that are inactive or expired
  /// at tpNow, purge tombstones past their expiry and forget fingerprints no
  /// cached session refers to. Returns records evicted.
  int evictStale(common::TimePoint tpNow);

  /// Janitor's bulk durable deactivation. Runs synchronously on the caller's
  /// thread; returns nullopt (after logging) if the durable tier failed.
  std::optional<int> deactivateExpired(common::TimePoint tpNow);

  /// Re-queue durable deactivations that failed earlier. Returns how many.
  int retryFailedDeactivations();

  /// Durable half of "log out everywhere"; queued on the write-behind worker.
  void deactivateAllForUser(const std::string& sUserId,
                            const std::optional<std::string>& oExceptSessionId);

  void rememberFingerprint(const std::string& sDeviceId, const common::DeviceFingerprint& dfp);
  std::optional<common::DeviceFingerprint> findFingerprint(const std::string& sDeviceId) const;

  /// Block until all queued durable writes have completed or failed.
  void flush();

  size_t cacheSize() const;
  size_t tombstoneCount() const;
  size_t pendingDeactivationCount() const;
  int64_t persistenceFailures() const { return _iPersistFailures.load(); }

 private:
  /// Returns false if the write failed (already logged and counted).
  bool writeBehindAttempt(const std::string& sOperation, const std::string& sKey,
                          const std::function<void()>& fnWrite);
  void writeBehind(const std::string& sOperation, const std::string& sKey,
                   std::function<void()> fnWrite);
  void queueDeactivation(const std::string& sSessionId);
  void indexInsert(const common::SessionRecord& rec);
  void indexErase(const common::SessionRecord& rec);

  ISessionStore& _ssDurable;

  mutable std::shared_mutex _smtx;
  std::unordered_map<std::string, common::SessionRecord> _mCache;
  std::unordered_map<std::string, common::SessionRecord> _mTombstones;
  std::unordered_set<std::string> _sPendingDeactivation;
  std::unordered_set<std::string> _sFailedDeactivation;
  std::unordered_map<std::string, std::unordered_set<std::string>> _mUserIndex;
  std::unordered_map<std::string, common::DeviceFingerprint> _mFingerprints;

  std::atomic<int64_t> _iPersistFailures{0};
  core::ThreadPool _tpWriter;
};

}  // namespace sguard::dal
