#include "security/UserAgentClassifier.hpp"

#include <gtest/gtest.h>

using sguard::security::UaRule;
using sguard::security::UserAgentClassifier;

namespace {

const UserAgentClassifier& classifier() {
  static const UserAgentClassifier uac = UserAgentClassifier::withDefaultRules();
  return uac;
}

}  // namespace

TEST(UserAgentClassifierTest, ChromeOnWindowsDesktop) {
  auto di = classifier().classify(
      "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) "
      "Chrome/120.0.0.0 Safari/537.36");
  EXPECT_EQ(di.sBrowser, "Chrome");
  EXPECT_EQ(di.sOs, "Windows");
  EXPECT_EQ(di.sDeviceClass, "Desktop");
  EXPECT_FALSE(di.bIsMobile);
}

TEST(UserAgentClassifierTest, EdgeIsNotReportedAsChrome) {
  auto di = classifier().classify(
      "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) "
      "Chrome/120.0.0.0 Safari/537.36 Edg/120.0.2210.91");
  EXPECT_EQ(di.sBrowser, "Edge");
}

TEST(UserAgentClassifierTest, OperaIsNotReportedAsChrome) {
  auto di = classifier().classify(
      "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) "
      "Chrome/119.0.0.0 Safari/537.36 OPR/105.0.0.0");
  EXPECT_EQ(di.sBrowser, "Opera");
  EXPECT_EQ(di.sOs, "Linux");
}

TEST(UserAgentClassifierTest, SafariOnIPhoneIsMobileIos) {
  auto di = classifier().classify(
      "Mozilla/5.0 (iPhone; CPU iPhone OS 17_1 like Mac OS X) AppleWebKit/605.1.15 "
      "(KHTML, like Gecko) Version/17.1 Mobile/15E148 Safari/604.1");
  EXPECT_EQ(di.sBrowser, "Safari");
  EXPECT_EQ(di.sOs, "iOS");
  EXPECT_EQ(di.sDeviceClass, "Mobile");
  EXPECT_TRUE(di.bIsMobile);
}

TEST(UserAgentClassifierTest, IPadIsTablet) {
  auto di = classifier().classify(
      "Mozilla/5.0 (iPad; CPU OS 16_6 like Mac OS X) AppleWebKit/605.1.15 (KHTML, like Gecko) "
      "Version/16.6 Mobile/15E148 Safari/604.1");
  EXPECT_EQ(di.sOs, "iOS");
  EXPECT_EQ(di.sDeviceClass, "Tablet");
  EXPECT_TRUE(di.bIsMobile);
}

TEST(UserAgentClassifierTest, AndroidIsNotReportedAsLinux) {
  auto di = classifier().classify(
      "Mozilla/5.0 (Linux; Android 14; Pixel 8) AppleWebKit/537.36 (KHTML, like Gecko) "
      "Chrome/120.0.0.0 Mobile Safari/537.36");
  EXPECT_EQ(di.sBrowser, "Chrome");
  EXPECT_EQ(di.sOs, "Android");
  EXPECT_TRUE(di.bIsMobile);
}

TEST(UserAgentClassifierTest, FirefoxOnMac) {
  auto di = classifier().classify(
      "Mozilla/5.0 (Macintosh; Intel Mac OS X 14.1; rv:120.0) Gecko/20100101 Firefox/120.0");
  EXPECT_EQ(di.sBrowser, "Firefox");
  EXPECT_EQ(di.sOs, "macOS");
  EXPECT_FALSE(di.bIsMobile);
}

TEST(UserAgentClassifierTest, UnrecognisedAgentFallsBackToUnknownDesktop) {
  auto di = classifier().classify("curl/8.4.0");
  EXPECT_EQ(di.sBrowser, "Unknown");
  EXPECT_EQ(di.sOs, "Unknown");
  EXPECT_EQ(di.sDeviceClass, "Desktop");
  EXPECT_FALSE(di.bIsMobile);
}

TEST(UserAgentClassifierTest, CustomTablesAreHonoured) {
  UserAgentClassifier uac({{"Bot", {"curl/", "wget/"}}}, {}, {{"Headless", {"curl/"}}});
  auto di = uac.classify("curl/8.4.0");
  EXPECT_EQ(di.sBrowser, "Bot");
  EXPECT_EQ(di.sOs, "Unknown");
  EXPECT_EQ(di.sDeviceClass, "Headless");
  EXPECT_TRUE(di.bIsMobile);
}

TEST(UserAgentClassifierTest, FirstMatchPrefersEarlierRule) {
  std::vector<UaRule> vRules = {{"A", {"x"}}, {"B", {"x"}}};
  EXPECT_EQ(UserAgentClassifier::firstMatch(vRules, "xyz", "none"), "A");
  EXPECT_EQ(UserAgentClassifier::firstMatch(vRules, "abc", "none"), "none");
}
