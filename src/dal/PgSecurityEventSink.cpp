#include "dal/PgSecurityEventSink.hpp"

#include "common/TypesJson.hpp"
#include "dal/ConnectionPool.hpp"

#include <pqxx/pqxx>

namespace sguard::dal {

PgSecurityEventSink::PgSecurityEventSink(ConnectionPool& cpPool) : _cpPool(cpPool) {}
PgSecurityEventSink::~PgSecurityEventSink() = default;

void PgSecurityEventSink::append(const common::SecurityEvent& ev) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  txn.exec(
      "INSERT INTO security_events (user_id, event_type, timestamp, metadata) "
      "VALUES ($1, $2, to_timestamp($3::bigint / 1000.0), $4::jsonb)",
      pqxx::params{ev.sUserId, ev.sType, common::toEpochMillis(ev.tpTimestamp),
                   ev.jMetadata.dump()});
  txn.commit();
}

}  // namespace sguard::dal
