#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "providers/IFastLedger.hpp"

namespace ddns::providers {

class JsonRpcClient;

/// Resolver ledger reached through a JSON-RPC gateway.
/// Methods: resolver_getRecord, resolver_getBatchRecords,
/// resolver_setBatchRecords, resolver_awaitConfirmations.
class RpcFastLedger : public IFastLedger {
 public:
  explicit RpcFastLedger(JsonRpcClient& jrcClient);
  ~RpcFastLedger() override;

  std::string name() const override;
  common::FastRecord getRecord(const std::string& sDomainKey,
                               const std::string& sType) override;
  common::FastBatch getBatchRecords(const std::string& sDomainKey,
                                    const std::vector<std::string>& vTypes) override;
  std::string submitBatchWrite(const std::string& sDomainKey,
                               const std::vector<std::string>& vTypes,
                               const std::vector<std::string>& vValues,
                               const std::vector<uint32_t>& vTtls) override;
  void awaitConfirmations(const std::string& sConfirmationId, int iDepth) override;

  /// Decode a resolver_getRecord result. Null fields read as empty or zero.
  /// @throws LedgerError on a non-object result or a mistyped field
  static common::FastRecord parseRecord(const nlohmann::json& jResult);

  /// Decode a resolver_getBatchRecords result for nTypes requested types.
  /// @throws LedgerError on missing arrays, ValidationError on length mismatch
  static common::FastBatch parseBatch(const nlohmann::json& jResult, size_t nTypes);

 private:
  JsonRpcClient& _jrcClient;
};

}  // namespace ddns::providers
