#include "common/DomainHash.hpp"

#include <openssl/evp.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string_view>

namespace ddns::common {

std::string DomainHash::compute(const std::string& sDomainName) {
  unsigned char vHash[EVP_MAX_MD_SIZE];
  unsigned int uHashLen = 0;

  EVP_MD_CTX* pCtx = EVP_MD_CTX_new();
  if (!pCtx) {
    throw std::runtime_error("Failed to create digest context");
  }

  if (EVP_DigestInit_ex(pCtx, EVP_sha3_256(), nullptr) != 1 ||
      EVP_DigestUpdate(pCtx, sDomainName.data(), sDomainName.size()) != 1 ||
      EVP_DigestFinal_ex(pCtx, vHash, &uHashLen) != 1) {
    EVP_MD_CTX_free(pCtx);
    throw std::runtime_error("SHA3-256 hash computation failed");
  }

  EVP_MD_CTX_free(pCtx);

  std::ostringstream oss;
  oss << "0x" << std::hex << std::setfill('0');
  for (unsigned int i = 0; i < uHashLen; ++i) {
    oss << std::setw(2) << static_cast<int>(vHash[i]);
  }
  return oss.str();
}

bool DomainHash::isZero(const std::string& sRef) {
  std::string_view svBody(sRef);
  if (svBody.starts_with("0x") || svBody.starts_with("0X")) {
    svBody.remove_prefix(2);
  }
  for (char c : svBody) {
    if (c != '0') return false;
  }
  return true;
}

}  // namespace ddns::common
