#pragma once

#include <chrono>

#include "common/Types.hpp"

namespace sguard::core {

/// Pure abstract wall-clock source. Injected so expiry can be tested
/// without sleeping.
class IClock {
 public:
  virtual ~IClock() = default;

  virtual common::TimePoint now() const = 0;
};

/// Production clock backed by std::chrono::system_clock.
class SystemClock : public IClock {
 public:
  common::TimePoint now() const override { return std::chrono::system_clock::now(); }
};

}  // namespace sguard::core
