#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "common/Types.hpp"

namespace sguard::security {

/// OpenSSL-backed primitives for session identifiers.
/// Class abbreviation: cs
class CryptoService {
 public:
  /// Number of random bytes mixed into every session id (128 bits).
  static constexpr size_t kSessionIdRandomBytes = 16;

  /// SHA-256(epoch-millis ‖ hex(16 random bytes)) → 64-char lowercase hex.
  /// Throws std::runtime_error if the CSPRNG fails.
  static std::string generateSessionId(common::TimePoint tpNow);

  /// First 16 hex chars of SHA-256(userAgent ‖ ipAddress). A correlation key
  /// only: it carries no secret and is shared by identical UA/IP pairs.
  static std::string deriveDeviceId(const std::string& sUserAgent,
                                    const std::string& sIpAddress);

  /// SHA-256 → 64-char lowercase hex string.
  static std::string sha256Hex(const std::string& sInput);

  /// nCount bytes from RAND_bytes.
  static std::vector<unsigned char> randomBytes(size_t nCount);

 private:
  static std::string toHex(const unsigned char* pData, size_t nLen);
};

}  // namespace sguard::security
