#pragma once

#include <string>
#include <vector>

#include "common/Types.hpp"

namespace sguard::security {

/// One row of a classification table: the first rule with any token found
/// in the user agent (case-sensitive substring) wins.
struct UaRule {
  std::string sLabel;
  std::vector<std::string> vTokens;
};

/// Ordered, data-driven user-agent classifier producing DeviceInfo.
/// Order matters: Edge and Opera UAs also carry "Chrome/", Android UAs carry
/// "Linux", iOS UAs carry "Mac OS X".
/// Class abbreviation: uac
class UserAgentClassifier {
 public:
  UserAgentClassifier(std::vector<UaRule> vBrowserRules, std::vector<UaRule> vOsRules,
                      std::vector<UaRule> vDeviceRules);

  /// Classifier loaded with the built-in tables.
  static UserAgentClassifier withDefaultRules();

  common::DeviceInfo classify(const std::string& sUserAgent) const;

  /// Label of the first matching rule, or sFallback.
  static std::string firstMatch(const std::vector<UaRule>& vRules,
                                const std::string& sUserAgent, const std::string& sFallback);

 private:
  std::vector<UaRule> _vBrowserRules;
  std::vector<UaRule> _vOsRules;
  std::vector<UaRule> _vDeviceRules;
};

}  // namespace sguard::security
