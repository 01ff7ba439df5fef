#include "providers/HttpContentStore.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <curl/curl.h>

namespace ddns::providers {

HttpContentStore::HttpContentStore(std::string sGateway, int iTimeoutMs)
    : _sGateway(std::move(sGateway)), _iTimeoutMs(iTimeoutMs) {
  if (!_sGateway.empty() && _sGateway.back() != '/') {
    _sGateway += '/';
  }
}

HttpContentStore::~HttpContentStore() = default;

std::string HttpContentStore::name() const { return "http-gateway"; }

size_t HttpContentStore::writeCallback(char* pData, size_t nSize, size_t nCount, void* pUser) {
  auto* pOut = static_cast<std::string*>(pUser);
  pOut->append(pData, nSize * nCount);
  return nSize * nCount;
}

std::string HttpContentStore::fetch(const std::string& sLocator) {
  if (sLocator.empty()) {
    throw common::ValidationError("empty_locator", "Content locator is empty");
  }

  const std::string sUrl = _sGateway + sLocator;
  CURL* pCurl = curl_easy_init();
  if (!pCurl) {
    throw common::ContentStoreError("content_transport", "curl_easy_init failed");
  }

  std::string sBody;
  curl_easy_setopt(pCurl, CURLOPT_URL, sUrl.c_str());
  curl_easy_setopt(pCurl, CURLOPT_HTTPGET, 1L);
  curl_easy_setopt(pCurl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(pCurl, CURLOPT_WRITEFUNCTION, writeCallback);
  curl_easy_setopt(pCurl, CURLOPT_WRITEDATA, &sBody);
  curl_easy_setopt(pCurl, CURLOPT_TIMEOUT_MS, static_cast<long>(_iTimeoutMs));
  curl_easy_setopt(pCurl, CURLOPT_NOSIGNAL, 1L);

  const CURLcode res = curl_easy_perform(pCurl);
  long lStatus = 0;
  curl_easy_getinfo(pCurl, CURLINFO_RESPONSE_CODE, &lStatus);
  curl_easy_cleanup(pCurl);

  if (res != CURLE_OK) {
    throw common::ContentStoreError("content_transport",
                                    sUrl + ": " + curl_easy_strerror(res));
  }
  if (lStatus == 404) {
    throw common::NotFoundError("content_not_found", "No document at " + sUrl);
  }
  if (lStatus >= 400) {
    throw common::ContentStoreError("content_http_status",
                                    sUrl + " returned HTTP " + std::to_string(lStatus));
  }

  common::Logger::get()->debug("Fetched {} bytes from {}", sBody.size(), sUrl);
  return sBody;
}

}  // namespace ddns::providers
