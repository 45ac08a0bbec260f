#include "security/SecurityHeuristics.hpp"

#include "common/Logger.hpp"

#include <algorithm>
#include <cctype>

namespace sguard::security {

SecurityHeuristics::SecurityHeuristics(const common::SessionPolicy& spPolicy)
    : _bEnabled(spPolicy.bEnableSuspiciousActivityDetection),
      _iRapidThreshold(spPolicy.iRapidCreationThreshold),
      _durWindow(spPolicy.iRapidCreationWindowSeconds) {}

SecurityHeuristics::~SecurityHeuristics() = default;

std::string SecurityHeuristics::networkPrefix(const std::string& sIpAddress) {
  const bool bIsV6 = sIpAddress.find(':') != std::string::npos;
  const char cSep = bIsV6 ? ':' : '.';

  const auto nFirst = sIpAddress.find(cSep);
  if (nFirst == std::string::npos) return sIpAddress;
  const auto nSecond = sIpAddress.find(cSep, nFirst + 1);
  std::string sPrefix =
      nSecond == std::string::npos ? sIpAddress : sIpAddress.substr(0, nSecond);

  if (bIsV6) {
    std::transform(sPrefix.begin(), sPrefix.end(), sPrefix.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  }
  return sPrefix;
}

HeuristicVerdict SecurityHeuristics::detectAtCreation(
    const std::string& sUserId, const std::string& sIpAddress, const std::string& sDeviceId,
    const std::vector<common::SessionRecord>& vPriorActive, common::TimePoint tpNow) {
  if (!_bEnabled) return {};

  HeuristicVerdict hv;
  {
    std::lock_guard<std::mutex> lock(_mtx);
    auto& dqCreations = _mCreations[sUserId];
    const auto tpCutoff = tpNow - _durWindow;
    while (!dqCreations.empty() && dqCreations.front() <= tpCutoff) {
      dqCreations.pop_front();
    }
    const auto iRecent = static_cast<int>(dqCreations.size());
    dqCreations.push_back(tpNow);

    if (iRecent > _iRapidThreshold) {
      hv = {true, "rapid_creation"};
    }
  }

  if (!hv.bSuspicious && !vPriorActive.empty()) {
    const std::string sPrefix = networkPrefix(sIpAddress);
    const bool bFamiliar =
        std::any_of(vPriorActive.begin(), vPriorActive.end(), [&](const auto& rec) {
          return networkPrefix(rec.sIpAddress) == sPrefix;
        });
    if (!bFamiliar) {
      hv = {true, "unfamiliar_network"};
    }
  }

  if (hv.bSuspicious) {
    std::lock_guard<std::mutex> lock(_mtx);
    ++_mSuspicious[sUserId];
    common::Logger::get()->info("Suspicious session creation for user {} (device {}): {}",
                                sUserId, sDeviceId, hv.sSignal);
  }
  return hv;
}

bool SecurityHeuristics::ipChanged(const common::SessionRecord& rec,
                                   const std::optional<std::string>& oIpAddress) const {
  return _bEnabled && oIpAddress.has_value() && !oIpAddress->empty() &&
         *oIpAddress != rec.sIpAddress;
}

int64_t SecurityHeuristics::suspiciousCount(const std::string& sUserId) const {
  std::lock_guard<std::mutex> lock(_mtx);
  auto it = _mSuspicious.find(sUserId);
  return it == _mSuspicious.end() ? 0 : it->second;
}

int64_t SecurityHeuristics::totalSuspicious() const {
  std::lock_guard<std::mutex> lock(_mtx);
  int64_t iTotal = 0;
  for (const auto& [sUser, iCount] : _mSuspicious) {
    iTotal += iCount;
  }
  return iTotal;
}

void SecurityHeuristics::pruneHistory(common::TimePoint tpNow) {
  std::lock_guard<std::mutex> lock(_mtx);
  const auto tpCutoff = tpNow - _durWindow;
  for (auto it = _mCreations.begin(); it != _mCreations.end();) {
    auto& dqCreations = it->second;
    while (!dqCreations.empty() && dqCreations.front() <= tpCutoff) {
      dqCreations.pop_front();
    }
    if (dqCreations.empty()) {
      it = _mCreations.erase(it);
    } else {
      ++it;
    }
  }
}

}  // namespace sguard::security
