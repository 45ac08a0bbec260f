#pragma once

#include <optional>
#include <string>

#include "common/Types.hpp"

namespace sguard::security {

/// Pure abstract IP geolocation lookup (external service).
/// Used only when location tracking is enabled; failures leave the
/// session's location unset.
class IGeoLocator {
 public:
  virtual ~IGeoLocator() = default;

  virtual std::optional<common::Location> lookup(const std::string& sIpAddress) = 0;
};

}  // namespace sguard::security
