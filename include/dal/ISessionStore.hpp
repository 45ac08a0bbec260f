#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/Types.hpp"

namespace sguard::dal {

/// Pure abstract interface for the durable session tier.
/// Implementations report failures by throwing (common::PersistenceError or
/// the driver's own exceptions); SessionRecordStore catches and logs them.
class ISessionStore {
 public:
  virtual ~ISessionStore() = default;

  /// Insert or replace the full record.
  virtual void upsert(const common::SessionRecord& rec) = 0;

  /// Apply the set members of updFields. A deactivated record stays deactivated.
  virtual void updateFields(const std::string& sSessionId,
                            const common::SessionFieldUpdate& updFields) = 0;

  virtual std::optional<common::SessionRecord> findById(const std::string& sSessionId) = 0;

  virtual std::vector<common::SessionRecord> findActiveByUser(const std::string& sUserId) = 0;

  /// Deactivate every active record with expires_at < tpBefore. Returns rows touched.
  virtual int bulkDeactivateExpired(common::TimePoint tpBefore) = 0;

  /// Deactivate every active record for a user except oExceptSessionId.
  /// Returns rows touched.
  virtual int deactivateAllForUser(const std::string& sUserId,
                                   const std::optional<std::string>& oExceptSessionId) = 0;
};

}  // namespace sguard::dal
