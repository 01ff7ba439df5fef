#include "providers/JsonRpcClient.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <curl/curl.h>
#include <openssl/crypto.h>

namespace ddns::providers {

JsonRpcClient::JsonRpcClient(std::string sEndpoint, std::string sAuthToken, int iTimeoutMs)
    : _sEndpoint(std::move(sEndpoint)),
      _sAuthToken(std::move(sAuthToken)),
      _iTimeoutMs(iTimeoutMs) {}

JsonRpcClient::~JsonRpcClient() {
  if (!_sAuthToken.empty()) {
    OPENSSL_cleanse(_sAuthToken.data(), _sAuthToken.size());
  }
}

size_t JsonRpcClient::writeCallback(char* pData, size_t nSize, size_t nCount, void* pUser) {
  auto* pOut = static_cast<std::string*>(pUser);
  pOut->append(pData, nSize * nCount);
  return nSize * nCount;
}

std::string JsonRpcClient::post(const std::string& sBody) {
  CURL* pCurl = curl_easy_init();
  if (!pCurl) {
    throw common::LedgerError("rpc_transport", "curl_easy_init failed");
  }

  struct curl_slist* pHeaders = nullptr;
  pHeaders = curl_slist_append(pHeaders, "Content-Type: application/json");
  std::string sAuthHeader;
  if (!_sAuthToken.empty()) {
    sAuthHeader = "Authorization: Bearer " + _sAuthToken;
    pHeaders = curl_slist_append(pHeaders, sAuthHeader.c_str());
  }

  std::string sResponse;
  curl_easy_setopt(pCurl, CURLOPT_URL, _sEndpoint.c_str());
  curl_easy_setopt(pCurl, CURLOPT_HTTPHEADER, pHeaders);
  curl_easy_setopt(pCurl, CURLOPT_POST, 1L);
  curl_easy_setopt(pCurl, CURLOPT_POSTFIELDS, sBody.c_str());
  curl_easy_setopt(pCurl, CURLOPT_POSTFIELDSIZE, static_cast<long>(sBody.size()));
  curl_easy_setopt(pCurl, CURLOPT_WRITEFUNCTION, writeCallback);
  curl_easy_setopt(pCurl, CURLOPT_WRITEDATA, &sResponse);
  curl_easy_setopt(pCurl, CURLOPT_TIMEOUT_MS, static_cast<long>(_iTimeoutMs));
  curl_easy_setopt(pCurl, CURLOPT_NOSIGNAL, 1L);

  const CURLcode res = curl_easy_perform(pCurl);
  long lStatus = 0;
  curl_easy_getinfo(pCurl, CURLINFO_RESPONSE_CODE, &lStatus);

  curl_slist_free_all(pHeaders);
  curl_easy_cleanup(pCurl);
  if (!sAuthHeader.empty()) {
    OPENSSL_cleanse(sAuthHeader.data(), sAuthHeader.size());
  }

  if (res != CURLE_OK) {
    throw common::LedgerError("rpc_transport",
                              _sEndpoint + ": " + curl_easy_strerror(res));
  }
  if (lStatus >= 400) {
    throw common::LedgerError("rpc_http_status",
                              _sEndpoint + " returned HTTP " + std::to_string(lStatus));
  }
  return sResponse;
}

nlohmann::json JsonRpcClient::call(const std::string& sMethod, const nlohmann::json& jParams) {
  const uint64_t uId = _uNextId.fetch_add(1);
  const nlohmann::json jRequest = {
      {"jsonrpc", "2.0"},
      {"id", uId},
      {"method", sMethod},
      {"params", jParams},
  };

  common::Logger::get()->trace("JSON-RPC -> {} {}", _sEndpoint, sMethod);
  const std::string sRaw = post(jRequest.dump());

  nlohmann::json jResponse;
  try {
    jResponse = nlohmann::json::parse(sRaw);
  } catch (const nlohmann::json::exception& ex) {
    throw common::LedgerError("rpc_malformed_response",
                              sMethod + ": response is not valid JSON: " + ex.what());
  }

  if (jResponse.contains("error") && !jResponse["error"].is_null()) {
    const auto& jErr = jResponse["error"];
    const std::string sMsg = jErr.is_object() ? jErr.value("message", jErr.dump()) : jErr.dump();
    throw common::LedgerError("rpc_error", sMethod + ": " + sMsg);
  }
  if (!jResponse.contains("result")) {
    throw common::LedgerError("rpc_malformed_response", sMethod + ": response has no result");
  }
  return jResponse["result"];
}

}  // namespace ddns::providers
