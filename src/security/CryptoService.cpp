#include "security/CryptoService.hpp"

#include "common/TypesJson.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace sguard::security {

namespace {
constexpr size_t kDeviceIdHexLen = 16;
}  // namespace

std::string CryptoService::toHex(const unsigned char* pData, size_t nLen) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (size_t i = 0; i < nLen; ++i) {
    oss << std::setw(2) << static_cast<int>(pData[i]);
  }
  return oss.str();
}

std::vector<unsigned char> CryptoService::randomBytes(size_t nCount) {
  std::vector<unsigned char> vBytes(nCount);
  if (nCount > 0 && RAND_bytes(vBytes.data(), static_cast<int>(nCount)) != 1) {
    throw std::runtime_error("Failed to generate random bytes");
  }
  return vBytes;
}

std::string CryptoService::sha256Hex(const std::string& sInput) {
  unsigned char vHash[EVP_MAX_MD_SIZE];
  unsigned int uHashLen = 0;

  EVP_MD_CTX* pCtx = EVP_MD_CTX_new();
  if (!pCtx) {
    throw std::runtime_error("Failed to create digest context");
  }

  if (EVP_DigestInit_ex(pCtx, EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(pCtx, sInput.data(), sInput.size()) != 1 ||
      EVP_DigestFinal_ex(pCtx, vHash, &uHashLen) != 1) {
    EVP_MD_CTX_free(pCtx);
    throw std::runtime_error("SHA-256 hash computation failed");
  }

  EVP_MD_CTX_free(pCtx);
  return toHex(vHash, uHashLen);
}

std::string CryptoService::generateSessionId(common::TimePoint tpNow) {
  const auto vRandom = randomBytes(kSessionIdRandomBytes);
  return sha256Hex(std::to_string(common::toEpochMillis(tpNow)) +
                   toHex(vRandom.data(), vRandom.size()));
}

std::string CryptoService::deriveDeviceId(const std::string& sUserAgent,
                                          const std::string& sIpAddress) {
  return sha256Hex(sUserAgent + sIpAddress).substr(0, kDeviceIdHexLen);
}

}  // namespace sguard::security
