#pragma once

#include <optional>
#include <string>
#include <vector>

#include "dal/ISessionStore.hpp"

namespace sguard::dal {

class ConnectionPool;

/// PostgreSQL implementation of the durable tier over the user_sessions table.
/// Timestamps are TIMESTAMPTZ; device_info, security_flags and location are JSONB.
/// Class abbreviation: pss
class PgSessionStore : public ISessionStore {
 public:
  explicit PgSessionStore(ConnectionPool& cpPool);
  ~PgSessionStore() override;

  void upsert(const common::SessionRecord& rec) override;
  void updateFields(const std::string& sSessionId,
                    const common::SessionFieldUpdate& updFields) override;
  std::optional<common::SessionRecord> findById(const std::string& sSessionId) override;
  std::vector<common::SessionRecord> findActiveByUser(const std::string& sUserId) override;
  int bulkDeactivateExpired(common::TimePoint tpBefore) override;
  int deactivateAllForUser(const std::string& sUserId,
                           const std::optional<std::string>& oExceptSessionId) override;

 private:
  ConnectionPool& _cpPool;
};

}  // namespace sguard::dal
