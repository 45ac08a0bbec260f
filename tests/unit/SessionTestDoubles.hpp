#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/Errors.hpp"
#include "common/Types.hpp"
#include "core/Clock.hpp"
#include "dal/ISessionStore.hpp"
#include "security/IGeoLocator.hpp"
#include "security/ISecurityEventSink.hpp"

namespace sguard::test {

/// In-memory durable tier with the same merge rules as PgSessionStore.
/// Failures are switched on with bFailWrites / bFailReads.
class FakeSessionStore : public dal::ISessionStore {
 public:
  std::atomic<bool> bFailWrites{false};
  std::atomic<bool> bFailReads{false};

  void upsert(const common::SessionRecord& rec) override {
    std::lock_guard<std::mutex> lock(_mtx);
    failWriteIfRequested("upsert");
    _vOps.push_back("upsert:" + rec.sSessionId);
    auto it = _mRows.find(rec.sSessionId);
    if (it == _mRows.end()) {
      _mRows.emplace(rec.sSessionId, rec);
      return;
    }
    const bool bWasActive = it->second.bIsActive;
    const auto tpLast = std::max(it->second.tpLastActivity, rec.tpLastActivity);
    it->second = rec;
    it->second.bIsActive = bWasActive && rec.bIsActive;
    it->second.tpLastActivity = tpLast;
  }

  void updateFields(const std::string& sSessionId,
                    const common::SessionFieldUpdate& updFields) override {
    std::lock_guard<std::mutex> lock(_mtx);
    failWriteIfRequested("update");
    _vOps.push_back(std::string(updFields.oIsActive.has_value() ? "deactivate:" : "update:") +
                    sSessionId);
    auto it = _mRows.find(sSessionId);
    if (it == _mRows.end()) return;
    if (updFields.oLastActivity.has_value()) {
      it->second.tpLastActivity = std::max(it->second.tpLastActivity, *updFields.oLastActivity);
    }
    if (updFields.oIsActive.has_value()) {
      it->second.bIsActive = it->second.bIsActive && *updFields.oIsActive;
    }
    if (updFields.oFlags.has_value()) {
      it->second.sfFlags = *updFields.oFlags;
    }
  }

  std::optional<common::SessionRecord> findById(const std::string& sSessionId) override {
    std::lock_guard<std::mutex> lock(_mtx);
    failReadIfRequested();
    auto it = _mRows.find(sSessionId);
    if (it == _mRows.end()) return std::nullopt;
    return it->second;
  }

  std::vector<common::SessionRecord> findActiveByUser(const std::string& sUserId) override {
    std::lock_guard<std::mutex> lock(_mtx);
    failReadIfRequested();
    std::vector<common::SessionRecord> vResult;
    for (const auto& [sId, rec] : _mRows) {
      if (rec.sUserId == sUserId && rec.bIsActive) vResult.push_back(rec);
    }
    return vResult;
  }

  int bulkDeactivateExpired(common::TimePoint tpBefore) override {
    std::lock_guard<std::mutex> lock(_mtx);
    failWriteIfRequested("bulk");
    int iCount = 0;
    for (auto& [sId, rec] : _mRows) {
      if (rec.bIsActive && rec.tpExpiresAt < tpBefore) {
        rec.bIsActive = false;
        ++iCount;
      }
    }
    return iCount;
  }

  int deactivateAllForUser(const std::string& sUserId,
                           const std::optional<std::string>& oExceptSessionId) override {
    std::lock_guard<std::mutex> lock(_mtx);
    failWriteIfRequested("deactivate-all");
    _vOps.push_back("deactivate-all:" + sUserId);
    int iCount = 0;
    for (auto& [sId, rec] : _mRows) {
      if (rec.sUserId != sUserId || !rec.bIsActive) continue;
      if (oExceptSessionId.has_value() && sId == *oExceptSessionId) continue;
      rec.bIsActive = false;
      ++iCount;
    }
    return iCount;
  }

  /// Seed a row directly, bypassing the cache.
  void put(const common::SessionRecord& rec) {
    std::lock_guard<std::mutex> lock(_mtx);
    _mRows.insert_or_assign(rec.sSessionId, rec);
  }

  std::optional<common::SessionRecord> row(const std::string& sSessionId) const {
    std::lock_guard<std::mutex> lock(_mtx);
    auto it = _mRows.find(sSessionId);
    if (it == _mRows.end()) return std::nullopt;
    return it->second;
  }

  std::vector<std::string> ops() const {
    std::lock_guard<std::mutex> lock(_mtx);
    return _vOps;
  }

 private:
  void failWriteIfRequested(const char* pOp) {
    if (bFailWrites.load()) {
      throw common::PersistenceError("db_unavailable", std::string("fake ") + pOp + " failure");
    }
  }
  void failReadIfRequested() {
    if (bFailReads.load()) {
      throw common::PersistenceError("db_unavailable", "fake read failure");
    }
  }

  mutable std::mutex _mtx;
  std::map<std::string, common::SessionRecord> _mRows;
  std::vector<std::string> _vOps;
};

/// Captures events in arrival order.
class FakeEventSink : public security::ISecurityEventSink {
 public:
  std::atomic<bool> bFail{false};

  void append(const common::SecurityEvent& ev) override {
    if (bFail.load()) {
      throw std::runtime_error("fake sink failure");
    }
    std::lock_guard<std::mutex> lock(_mtx);
    _vEvents.push_back(ev);
  }

  std::vector<common::SecurityEvent> events() const {
    std::lock_guard<std::mutex> lock(_mtx);
    return _vEvents;
  }

  std::vector<common::SecurityEvent> ofType(const std::string& sType) const {
    std::lock_guard<std::mutex> lock(_mtx);
    std::vector<common::SecurityEvent> vResult;
    for (const auto& ev : _vEvents) {
      if (ev.sType == sType) vResult.push_back(ev);
    }
    return vResult;
  }

 private:
  mutable std::mutex _mtx;
  std::vector<common::SecurityEvent> _vEvents;
};

/// Clock that only moves when told to.
class ManualClock : public core::IClock {
 public:
  ManualClock() : _tpNow(std::chrono::sys_days{std::chrono::year{2024} / 3 / 1}) {}

  common::TimePoint now() const override {
    std::lock_guard<std::mutex> lock(_mtx);
    return _tpNow;
  }

  void advance(std::chrono::system_clock::duration dur) {
    std::lock_guard<std::mutex> lock(_mtx);
    _tpNow += dur;
  }

 private:
  mutable std::mutex _mtx;
  common::TimePoint _tpNow;
};

class FakeGeoLocator : public security::IGeoLocator {
 public:
  std::map<std::string, common::Location> mKnown;
  bool bThrow = false;

  std::optional<common::Location> lookup(const std::string& sIpAddress) override {
    if (bThrow) {
      throw std::runtime_error("geo service down");
    }
    auto it = mKnown.find(sIpAddress);
    if (it == mKnown.end()) return std::nullopt;
    return it->second;
  }
};

/// Active record with sensible defaults relative to tpNow.
inline common::SessionRecord makeRecord(const std::string& sSessionId, const std::string& sUserId,
                                        common::TimePoint tpNow,
                                        std::chrono::minutes durTtl = std::chrono::minutes(480)) {
  common::SessionRecord rec;
  rec.sSessionId = sSessionId;
  rec.sUserId = sUserId;
  rec.sDeviceId = "dev-" + sSessionId;
  rec.sIpAddress = "10.0.0.1";
  rec.sUserAgent = "Mozilla/5.0 (X11; Linux x86_64) Firefox/120.0";
  rec.tpCreatedAt = tpNow;
  rec.tpLastActivity = tpNow;
  rec.tpExpiresAt = tpNow + durTtl;
  rec.bIsActive = true;
  return rec;
}

}  // namespace sguard::test
