#include "security/UserAgentClassifier.hpp"

#include <utility>

namespace sguard::security {

namespace {

constexpr const char* kUnknown = "Unknown";
constexpr const char* kDesktop = "Desktop";

std::vector<UaRule> defaultBrowserRules() {
  return {
      {"Edge", {"Edg/", "EdgA/", "EdgiOS/", "Edge/"}},
      {"Opera", {"OPR/", "Opera"}},
      {"Firefox", {"Firefox/", "FxiOS/"}},
      {"Chrome", {"Chrome/", "CriOS/", "Chromium/"}},
      {"Safari", {"Safari/"}},
  };
}

std::vector<UaRule> defaultOsRules() {
  return {
      {"Windows", {"Windows"}},
      {"Android", {"Android"}},
      {"iOS", {"iPhone", "iPad", "iPod", "iOS"}},
      {"macOS", {"Macintosh", "Mac OS X"}},
      {"ChromeOS", {"CrOS"}},
      {"Linux", {"Linux"}},
  };
}

std::vector<UaRule> defaultDeviceRules() {
  return {
      {"Tablet", {"iPad", "Tablet"}},
      {"Mobile", {"Mobile", "Android", "iPhone", "iPod"}},
  };
}

}  // namespace

UserAgentClassifier::UserAgentClassifier(std::vector<UaRule> vBrowserRules,
                                         std::vector<UaRule> vOsRules,
                                         std::vector<UaRule> vDeviceRules)
    : _vBrowserRules(std::move(vBrowserRules)),
      _vOsRules(std::move(vOsRules)),
      _vDeviceRules(std::move(vDeviceRules)) {}

UserAgentClassifier UserAgentClassifier::withDefaultRules() {
  return UserAgentClassifier(defaultBrowserRules(), defaultOsRules(), defaultDeviceRules());
}

std::string UserAgentClassifier::firstMatch(const std::vector<UaRule>& vRules,
                                            const std::string& sUserAgent,
                                            const std::string& sFallback) {
  for (const auto& rule : vRules) {
    for (const auto& sToken : rule.vTokens) {
      if (!sToken.empty() && sUserAgent.find(sToken) != std::string::npos) {
        return rule.sLabel;
      }
    }
  }
  return sFallback;
}

common::DeviceInfo UserAgentClassifier::classify(const std::string& sUserAgent) const {
  common::DeviceInfo di;
  di.sBrowser = firstMatch(_vBrowserRules, sUserAgent, kUnknown);
  di.sOs = firstMatch(_vOsRules, sUserAgent, kUnknown);
  di.sDeviceClass = firstMatch(_vDeviceRules, sUserAgent, kDesktop);
  di.bIsMobile = di.sDeviceClass != kDesktop;
  return di;
}

}  // namespace sguard::security
