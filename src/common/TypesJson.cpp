#include "common/TypesJson.hpp"

#include <chrono>
#include <string>

namespace sguard::common {

void to_json(nlohmann::json& j, const DeviceInfo& di) {
  j = nlohmann::json{
      {"browser", di.sBrowser},
      {"os", di.sOs},
      {"device", di.sDeviceClass},
      {"isMobile", di.bIsMobile},
  };
}

void from_json(const nlohmann::json& j, DeviceInfo& di) {
  di.sBrowser = j.value("browser", std::string("Unknown"));
  di.sOs = j.value("os", std::string("Unknown"));
  di.sDeviceClass = j.value("device", std::string("Desktop"));
  di.bIsMobile = j.value("isMobile", false);
}

void to_json(nlohmann::json& j, const SecurityFlags& sf) {
  j = nlohmann::json{
      {"isSecure", sf.bIsSecure},
      {"isTrusted", sf.bIsTrusted},
      {"requiresReauth", sf.bRequiresReauth},
      {"suspiciousActivity", sf.bSuspiciousActivity},
  };
}

void from_json(const nlohmann::json& j, SecurityFlags& sf) {
  sf.bIsSecure = j.value("isSecure", false);
  sf.bIsTrusted = j.value("isTrusted", true);
  sf.bRequiresReauth = j.value("requiresReauth", false);
  sf.bSuspiciousActivity = j.value("suspiciousActivity", false);
}

void to_json(nlohmann::json& j, const Location& loc) {
  j = nlohmann::json{
      {"country", loc.sCountry},
      {"city", loc.sCity},
      {"timezone", loc.sTimezone},
  };
}

void from_json(const nlohmann::json& j, Location& loc) {
  loc.sCountry = j.value("country", std::string{});
  loc.sCity = j.value("city", std::string{});
  loc.sTimezone = j.value("timezone", std::string{});
}

int64_t toEpochMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint fromEpochMillis(int64_t iMillis) {
  return TimePoint(std::chrono::duration_cast<TimePoint::duration>(
      std::chrono::milliseconds(iMillis)));
}

}  // namespace sguard::common
