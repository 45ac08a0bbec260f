#include "core/CapacityEnforcer.hpp"

#include "common/Logger.hpp"
#include "dal/SessionRecordStore.hpp"

#include <algorithm>
#include <tuple>

namespace sguard::core {

CapacityEnforcer::CapacityEnforcer(dal::SessionRecordStore& srsStore, int iMaxSessions)
    : _srsStore(srsStore), _iMaxSessions(iMaxSessions) {}

CapacityEnforcer::~CapacityEnforcer() = default;

bool CapacityEnforcer::evictsBefore(const common::SessionRecord& recA,
                                    const common::SessionRecord& recB) {
  return std::tie(recA.tpLastActivity, recA.tpCreatedAt, recA.sSessionId) <
         std::tie(recB.tpLastActivity, recB.tpCreatedAt, recB.sSessionId);
}

std::vector<common::SessionRecord> CapacityEnforcer::selectVictims(
    std::vector<common::SessionRecord> vActive, int iMaxSessions) {
  std::sort(vActive.begin(), vActive.end(), evictsBefore);

  std::vector<common::SessionRecord> vVictims;
  size_t nRemaining = vActive.size();
  const auto nMax = static_cast<size_t>(std::max(iMaxSessions, 1));
  for (size_t i = 0; nRemaining >= nMax; ++i, --nRemaining) {
    vVictims.push_back(vActive[i]);
  }
  return vVictims;
}

std::vector<std::string> CapacityEnforcer::enforce(const std::string& sUserId,
                                                   common::TimePoint tpNow,
                                                   const EvictFn& fnEvict) {
  auto vActive = _srsStore.listActiveByUser(sUserId);
  // Expired-but-unswept records do not hold a slot
  std::erase_if(vActive, [&](const auto& rec) { return rec.tpExpiresAt < tpNow; });

  std::vector<std::string> vEvicted;
  for (const auto& rec : selectVictims(std::move(vActive), _iMaxSessions)) {
    fnEvict(rec);
    vEvicted.push_back(rec.sSessionId);
  }

  if (!vEvicted.empty()) {
    common::Logger::get()->info("Session limit ({}) reached for user {}: evicted {} session(s)",
                                _iMaxSessions, sUserId, vEvicted.size());
  }
  return vEvicted;
}

}  // namespace sguard::core
