#pragma once

#include <functional>
#include <string>
#include <vector>

#include "common/Types.hpp"

namespace sguard::dal {
class SessionRecordStore;
}  // namespace sguard::dal

namespace sguard::core {

/// Keeps a user's active sessions below the configured maximum by evicting the
/// least recently active ones before a new session is inserted.
/// Class abbreviation: ce
class CapacityEnforcer {
 public:
  using EvictFn = std::function<void(const common::SessionRecord&)>;

  CapacityEnforcer(dal::SessionRecordStore& srsStore, int iMaxSessions);
  ~CapacityEnforcer();

  /// Makes room for one more session: while the user holds >= maxSessions
  /// active, unexpired sessions, hands the oldest to fnEvict.
  /// Returns the evicted session ids in eviction order.
  std::vector<std::string> enforce(const std::string& sUserId, common::TimePoint tpNow,
                                   const EvictFn& fnEvict);

  /// Eviction order: lastActivity asc, then createdAt asc, then sessionId.
  static bool evictsBefore(const common::SessionRecord& recA, const common::SessionRecord& recB);

  /// Pure selection: the records that must go so that one more fits under iMaxSessions.
  static std::vector<common::SessionRecord> selectVictims(
      std::vector<common::SessionRecord> vActive, int iMaxSessions);

  int maxSessions() const { return _iMaxSessions; }

 private:
  dal::SessionRecordStore& _srsStore;
  int _iMaxSessions;
};

}  // namespace sguard::core
