#include "dal/PgSessionStore.hpp"

#include "dal/ConnectionPool.hpp"
#include "dal/PgSecurityEventSink.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>

#include "unit/SessionTestDoubles.hpp"

using sguard::dal::ConnectionPool;
using sguard::dal::PgSecurityEventSink;
using sguard::dal::PgSessionStore;
using sguard::test::makeRecord;
using namespace std::chrono_literals;

namespace {

std::string getDbUrl() {
  const char* pUrl = std::getenv("SGUARD_DB_URL");
  return pUrl ? std::string(pUrl) : std::string{};
}

std::string readSchema() {
  std::ifstream ifs(SGUARD_SCHEMA_FILE);
  std::ostringstream oss;
  oss << ifs.rdbuf();
  return oss.str();
}

/// Millisecond-aligned so values survive the TIMESTAMPTZ round trip unchanged.
sguard::common::TimePoint nowMillis() {
  return std::chrono::time_point_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now());
}

}  // namespace

class PgSessionStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    _sDbUrl = getDbUrl();
    if (_sDbUrl.empty()) {
      GTEST_SKIP() << "SGUARD_DB_URL not set, skipping integration test";
    }
    _cpPool = std::make_unique<ConnectionPool>(_sDbUrl, 2);
    _pssStore = std::make_unique<PgSessionStore>(*_cpPool);

    auto cg = _cpPool->checkout();
    pqxx::work txn(*cg);
    txn.exec(readSchema());
    txn.exec("DELETE FROM user_sessions");
    txn.exec("DELETE FROM security_events");
    txn.commit();
  }

  std::string _sDbUrl;
  std::unique_ptr<ConnectionPool> _cpPool;
  std::unique_ptr<PgSessionStore> _pssStore;
};

TEST_F(PgSessionStoreTest, UpsertThenFindByIdPreservesFields) {
  const auto tpNow = nowMillis();
  auto rec = makeRecord("s1", "alice", tpNow);
  rec.diDevice = {"Firefox", "Linux", "Desktop", false};
  rec.sfFlags.bIsSecure = true;
  rec.oLocation = sguard::common::Location{"NZ", "Wellington", "Pacific/Auckland"};
  _pssStore->upsert(rec);

  auto oRec = _pssStore->findById("s1");
  ASSERT_TRUE(oRec.has_value());
  EXPECT_EQ(oRec->sUserId, "alice");
  EXPECT_EQ(oRec->sDeviceId, rec.sDeviceId);
  EXPECT_EQ(oRec->diDevice.sBrowser, "Firefox");
  EXPECT_TRUE(oRec->sfFlags.bIsSecure);
  ASSERT_TRUE(oRec->oLocation.has_value());
  EXPECT_EQ(oRec->oLocation->sCity, "Wellington");
  EXPECT_EQ(oRec->tpCreatedAt, tpNow);
  EXPECT_EQ(oRec->tpExpiresAt, rec.tpExpiresAt);
  EXPECT_TRUE(oRec->bIsActive);
}

TEST_F(PgSessionStoreTest, FindByIdReturnsNulloptForMissing) {
  EXPECT_FALSE(_pssStore->findById("missing").has_value());
}

TEST_F(PgSessionStoreTest, UpsertNeverReactivates) {
  auto rec = makeRecord("s1", "alice", nowMillis());
  rec.bIsActive = false;
  _pssStore->upsert(rec);

  rec.bIsActive = true;
  _pssStore->upsert(rec);

  EXPECT_FALSE(_pssStore->findById("s1")->bIsActive);
}

TEST_F(PgSessionStoreTest, UpdateFieldsAppliesOnlySetMembers) {
  const auto tpNow = nowMillis();
  _pssStore->upsert(makeRecord("s1", "alice", tpNow));

  sguard::common::SessionFieldUpdate upd;
  upd.oLastActivity = tpNow + 5min;
  _pssStore->updateFields("s1", upd);

  sguard::common::SessionFieldUpdate updBack;
  updBack.oLastActivity = tpNow + 1min;
  sguard::common::SecurityFlags sf;
  sf.bRequiresReauth = true;
  updBack.oFlags = sf;
  _pssStore->updateFields("s1", updBack);

  auto oRec = _pssStore->findById("s1");
  EXPECT_EQ(oRec->tpLastActivity, tpNow + 5min);
  EXPECT_TRUE(oRec->sfFlags.bRequiresReauth);
  EXPECT_TRUE(oRec->bIsActive);
}

TEST_F(PgSessionStoreTest, DeactivationIsPermanent) {
  _pssStore->upsert(makeRecord("s1", "alice", nowMillis()));

  sguard::common::SessionFieldUpdate updOff;
  updOff.oIsActive = false;
  _pssStore->updateFields("s1", updOff);
  sguard::common::SessionFieldUpdate updOn;
  updOn.oIsActive = true;
  _pssStore->updateFields("s1", updOn);

  EXPECT_FALSE(_pssStore->findById("s1")->bIsActive);
}

TEST_F(PgSessionStoreTest, FindActiveByUserFiltersInactiveAndOtherUsers) {
  const auto tpNow = nowMillis();
  _pssStore->upsert(makeRecord("s1", "alice", tpNow));
  auto recInactive = makeRecord("s2", "alice", tpNow);
  recInactive.bIsActive = false;
  _pssStore->upsert(recInactive);
  _pssStore->upsert(makeRecord("s3", "bob", tpNow));

  auto vActive = _pssStore->findActiveByUser("alice");
  ASSERT_EQ(vActive.size(), 1u);
  EXPECT_EQ(vActive[0].sSessionId, "s1");
}

TEST_F(PgSessionStoreTest, BulkDeactivateExpiredTouchesOnlyExpiredRows) {
  const auto tpNow = nowMillis();
  _pssStore->upsert(makeRecord("old", "alice", tpNow - 2h, 1h));
  _pssStore->upsert(makeRecord("fresh", "alice", tpNow));

  EXPECT_EQ(_pssStore->bulkDeactivateExpired(tpNow), 1);
  EXPECT_FALSE(_pssStore->findById("old")->bIsActive);
  EXPECT_TRUE(_pssStore->findById("fresh")->bIsActive);
  EXPECT_EQ(_pssStore->bulkDeactivateExpired(tpNow), 0);
}

TEST_F(PgSessionStoreTest, DeactivateAllForUserHonoursException) {
  const auto tpNow = nowMillis();
  _pssStore->upsert(makeRecord("s1", "alice", tpNow));
  _pssStore->upsert(makeRecord("s2", "alice", tpNow));
  _pssStore->upsert(makeRecord("s3", "bob", tpNow));

  EXPECT_EQ(_pssStore->deactivateAllForUser("alice", std::string("s2")), 1);
  EXPECT_TRUE(_pssStore->findById("s2")->bIsActive);
  EXPECT_EQ(_pssStore->deactivateAllForUser("alice", std::nullopt), 1);
  EXPECT_FALSE(_pssStore->findById("s2")->bIsActive);
  EXPECT_TRUE(_pssStore->findById("s3")->bIsActive);
}

TEST_F(PgSessionStoreTest, ExpiryMustFollowCreation) {
  auto rec = makeRecord("bad", "alice", nowMillis());
  rec.tpExpiresAt = rec.tpCreatedAt;
  EXPECT_THROW(_pssStore->upsert(rec), pqxx::check_violation);
}

TEST_F(PgSessionStoreTest, SecurityEventSinkAppendsRow) {
  PgSecurityEventSink pses(*_cpPool);
  pses.append({"alice", "session_created", nowMillis(), {{"sessionId", "s1"}}});

  auto cg = _cpPool->checkout();
  pqxx::nontransaction ntx(*cg);
  auto row = ntx.exec("SELECT user_id, event_type, metadata->>'sessionId' FROM security_events")
                 .one_row();
  EXPECT_EQ(row[0].as<std::string>(), "alice");
  EXPECT_EQ(row[1].as<std::string>(), "session_created");
  EXPECT_EQ(row[2].as<std::string>(), "s1");
}
