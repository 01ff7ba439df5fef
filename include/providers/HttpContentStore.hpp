#pragma once

#include <string>

#include "providers/IContentStore.hpp"

namespace ddns::providers {

/// Content store reached through an HTTP gateway (e.g. an IPFS gateway).
/// GET {gateway}{locator}; a trailing '/' is added to the gateway when missing.
/// Class abbreviation: hcs
class HttpContentStore : public IContentStore {
 public:
  HttpContentStore(std::string sGateway, int iTimeoutMs);
  ~HttpContentStore() override;

  std::string name() const override;
  std::string fetch(const std::string& sLocator) override;

  const std::string& gateway() const { return _sGateway; }

 private:
  static size_t writeCallback(char* pData, size_t nSize, size_t nCount, void* pUser);

  std::string _sGateway;
  int _iTimeoutMs;
};

}  // namespace ddns::providers
