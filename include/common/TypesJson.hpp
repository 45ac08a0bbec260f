#pragma once

#include <cstdint>

#include <nlohmann/json.hpp>

#include "common/Types.hpp"

namespace sguard::common {

// JSON mapping used by the JSONB columns of user_sessions and by event metadata.

void to_json(nlohmann::json& j, const DeviceInfo& di);
void from_json(const nlohmann::json& j, DeviceInfo& di);

void to_json(nlohmann::json& j, const SecurityFlags& sf);
void from_json(const nlohmann::json& j, SecurityFlags& sf);

void to_json(nlohmann::json& j, const Location& loc);
void from_json(const nlohmann::json& j, Location& loc);

/// Milliseconds since the Unix epoch.
int64_t toEpochMillis(TimePoint tp);
TimePoint fromEpochMillis(int64_t iMillis);

}  // namespace sguard::common
