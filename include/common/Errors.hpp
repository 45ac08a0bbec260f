#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace sguard::common {

/// Base error for all application-level exceptions.
/// Carries a status code and a machine-readable error code slug.
struct AppError : public std::runtime_error {
  int _iStatus;
  std::string _sErrorCode;

  explicit AppError(int iStatus, std::string sCode, std::string sMsg)
      : std::runtime_error(std::move(sMsg)),
        _iStatus(iStatus),
        _sErrorCode(std::move(sCode)) {}
};

/// 400: rejected input (empty user id, missing IP or user agent).
struct ValidationError : AppError {
  explicit ValidationError(std::string sCode, std::string sMsg)
      : AppError(400, std::move(sCode), std::move(sMsg)) {}
};

/// 503: durable tier failure. Non-fatal: the store logs and swallows it.
struct PersistenceError : AppError {
  explicit PersistenceError(std::string sCode, std::string sMsg)
      : AppError(503, std::move(sCode), std::move(sMsg)) {}
};

}  // namespace sguard::common
