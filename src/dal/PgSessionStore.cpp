#include "dal/PgSessionStore.hpp"

#include "common/TypesJson.hpp"
#include "dal/ConnectionPool.hpp"

#include <cstdint>

#include <nlohmann/json.hpp>
#include <pqxx/pqxx>

namespace sguard::dal {

namespace {

constexpr const char* kSelectColumns =
    "SELECT session_id, user_id, device_id, ip_address, user_agent, "
    "device_info::text, security_flags::text, location::text, "
    "(EXTRACT(EPOCH FROM created_at) * 1000)::bigint, "
    "(EXTRACT(EPOCH FROM last_activity) * 1000)::bigint, "
    "(EXTRACT(EPOCH FROM expires_at) * 1000)::bigint, "
    "is_active "
    "FROM user_sessions ";

common::SessionRecord rowToRecord(const pqxx::row& row) {
  common::SessionRecord rec;
  rec.sSessionId = row[0].as<std::string>();
  rec.sUserId = row[1].as<std::string>();
  rec.sDeviceId = row[2].as<std::string>();
  rec.sIpAddress = row[3].as<std::string>();
  rec.sUserAgent = row[4].as<std::string>();
  rec.diDevice = nlohmann::json::parse(row[5].as<std::string>()).get<common::DeviceInfo>();
  rec.sfFlags = nlohmann::json::parse(row[6].as<std::string>()).get<common::SecurityFlags>();
  if (!row[7].is_null()) {
    rec.oLocation = nlohmann::json::parse(row[7].as<std::string>()).get<common::Location>();
  }
  rec.tpCreatedAt = common::fromEpochMillis(row[8].as<int64_t>());
  rec.tpLastActivity = common::fromEpochMillis(row[9].as<int64_t>());
  rec.tpExpiresAt = common::fromEpochMillis(row[10].as<int64_t>());
  rec.bIsActive = row[11].as<bool>();
  return rec;
}

}  // namespace

PgSessionStore::PgSessionStore(ConnectionPool& cpPool) : _cpPool(cpPool) {}
PgSessionStore::~PgSessionStore() = default;

void PgSessionStore::upsert(const common::SessionRecord& rec) {
  std::optional<std::string> oLocation;
  if (rec.oLocation.has_value()) {
    oLocation = nlohmann::json(*rec.oLocation).dump();
  }

  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  // is_active only ever moves TRUE -> FALSE, last_activity only forward
  txn.exec(
      "INSERT INTO user_sessions (session_id, user_id, device_id, ip_address, user_agent, "
      "device_info, security_flags, location, created_at, last_activity, expires_at, is_active) "
      "VALUES ($1, $2, $3, $4, $5, $6::jsonb, $7::jsonb, $8::jsonb, "
      "to_timestamp($9::bigint / 1000.0), to_timestamp($10::bigint / 1000.0), "
      "to_timestamp($11::bigint / 1000.0), $12) "
      "ON CONFLICT (session_id) DO UPDATE SET "
      "security_flags = EXCLUDED.security_flags, "
      "location = EXCLUDED.location, "
      "last_activity = GREATEST(user_sessions.last_activity, EXCLUDED.last_activity), "
      "is_active = user_sessions.is_active AND EXCLUDED.is_active",
      pqxx::params{rec.sSessionId, rec.sUserId, rec.sDeviceId, rec.sIpAddress, rec.sUserAgent,
                   nlohmann::json(rec.diDevice).dump(), nlohmann::json(rec.sfFlags).dump(),
                   oLocation, common::toEpochMillis(rec.tpCreatedAt),
                   common::toEpochMillis(rec.tpLastActivity),
                   common::toEpochMillis(rec.tpExpiresAt), rec.bIsActive});
  txn.commit();
}

void PgSessionStore::updateFields(const std::string& sSessionId,
                                  const common::SessionFieldUpdate& updFields) {
  std::optional<int64_t> oLastActivity;
  if (updFields.oLastActivity.has_value()) {
    oLastActivity = common::toEpochMillis(*updFields.oLastActivity);
  }
  std::optional<std::string> oFlags;
  if (updFields.oFlags.has_value()) {
    oFlags = nlohmann::json(*updFields.oFlags).dump();
  }

  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  txn.exec(
      "UPDATE user_sessions SET "
      "last_activity = GREATEST(last_activity, "
      "  COALESCE(to_timestamp($2::bigint / 1000.0), last_activity)), "
      "is_active = is_active AND COALESCE($3::boolean, TRUE), "
      "security_flags = COALESCE($4::jsonb, security_flags) "
      "WHERE session_id = $1",
      pqxx::params{sSessionId, oLastActivity, updFields.oIsActive, oFlags});
  txn.commit();
}

std::optional<common::SessionRecord> PgSessionStore::findById(const std::string& sSessionId) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec(std::string(kSelectColumns) + "WHERE session_id = $1",
                         pqxx::params{sSessionId});
  txn.commit();

  if (result.empty()) return std::nullopt;
  return rowToRecord(result[0]);
}

std::vector<common::SessionRecord> PgSessionStore::findActiveByUser(const std::string& sUserId) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec(
      std::string(kSelectColumns) +
          "WHERE user_id = $1 AND is_active = TRUE ORDER BY last_activity ASC",
      pqxx::params{sUserId});
  txn.commit();

  std::vector<common::SessionRecord> vRecords;
  vRecords.reserve(result.size());
  for (const auto& row : result) {
    vRecords.push_back(rowToRecord(row));
  }
  return vRecords;
}

int PgSessionStore::bulkDeactivateExpired(common::TimePoint tpBefore) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec(
      "UPDATE user_sessions SET is_active = FALSE "
      "WHERE is_active = TRUE AND expires_at < to_timestamp($1::bigint / 1000.0)",
      pqxx::params{common::toEpochMillis(tpBefore)});
  txn.commit();
  return static_cast<int>(result.affected_rows());
}

int PgSessionStore::deactivateAllForUser(const std::string& sUserId,
                                         const std::optional<std::string>& oExceptSessionId) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec(
      "UPDATE user_sessions SET is_active = FALSE "
      "WHERE user_id = $1 AND is_active = TRUE "
      "AND ($2::text IS NULL OR session_id <> $2)",
      pqxx::params{sUserId, oExceptSessionId});
  txn.commit();
  return static_cast<int>(result.affected_rows());
}

}  // namespace sguard::dal
