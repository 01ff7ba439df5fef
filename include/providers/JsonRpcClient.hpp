#pragma once

#include <atomic>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace ddns::providers {

/// JSON-RPC 2.0 over HTTP POST (libcurl). One easy handle per call, so a
/// single client may be shared across threads.
/// Class abbreviation: jrc
class JsonRpcClient {
 public:
  /// sAuthToken may be empty; otherwise it is sent as "Authorization: Bearer".
  JsonRpcClient(std::string sEndpoint, std::string sAuthToken, int iTimeoutMs);
  ~JsonRpcClient();

  JsonRpcClient(const JsonRpcClient&) = delete;
  JsonRpcClient& operator=(const JsonRpcClient&) = delete;

  /// Invoke sMethod and return its "result" member.
  /// Throws LedgerError on transport failure, HTTP status >= 400, malformed
  /// responses, or a JSON-RPC "error" object.
  nlohmann::json call(const std::string& sMethod, const nlohmann::json& jParams);

  const std::string& endpoint() const { return _sEndpoint; }

 private:
  static size_t writeCallback(char* pData, size_t nSize, size_t nCount, void* pUser);
  std::string post(const std::string& sBody);

  std::string _sEndpoint;
  std::string _sAuthToken;
  int _iTimeoutMs;
  std::atomic<uint64_t> _uNextId{1};
};

}  // namespace ddns::providers
