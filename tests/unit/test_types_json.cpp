#include "common/TypesJson.hpp"

#include <gtest/gtest.h>

#include <chrono>

using namespace sguard::common;

TEST(TypesJsonTest, DeviceInfoUsesColumnKeys) {
  DeviceInfo di{"Firefox", "Linux", "Desktop", false};
  nlohmann::json j = di;
  EXPECT_EQ(j.at("browser"), "Firefox");
  EXPECT_EQ(j.at("os"), "Linux");
  EXPECT_EQ(j.at("device"), "Desktop");
  EXPECT_EQ(j.at("isMobile"), false);
}

TEST(TypesJsonTest, SecurityFlagsMissingKeysTakeSafeDefaults) {
  auto sf = nlohmann::json::object().get<SecurityFlags>();
  EXPECT_FALSE(sf.bIsSecure);
  EXPECT_TRUE(sf.bIsTrusted);
  EXPECT_FALSE(sf.bRequiresReauth);
  EXPECT_FALSE(sf.bSuspiciousActivity);
}

TEST(TypesJsonTest, SecurityFlagsParseStoredDocument) {
  auto sf = nlohmann::json::parse(
                R"({"isSecure":true,"isTrusted":false,"requiresReauth":true,"suspiciousActivity":true})")
                .get<SecurityFlags>();
  EXPECT_TRUE(sf.bIsSecure);
  EXPECT_FALSE(sf.bIsTrusted);
  EXPECT_TRUE(sf.bRequiresReauth);
  EXPECT_TRUE(sf.bSuspiciousActivity);
}

TEST(TypesJsonTest, LocationKeys) {
  Location loc{"NZ", "Wellington", "Pacific/Auckland"};
  nlohmann::json j = loc;
  EXPECT_EQ(j.dump(), R"({"city":"Wellington","country":"NZ","timezone":"Pacific/Auckland"})");
}

TEST(TypesJsonTest, EpochMillisTruncatesSubMillisecond) {
  const TimePoint tp = fromEpochMillis(1700000000123) + std::chrono::microseconds(456);
  EXPECT_EQ(toEpochMillis(tp), 1700000000123);
  EXPECT_EQ(toEpochMillis(fromEpochMillis(0)), 0);
}
