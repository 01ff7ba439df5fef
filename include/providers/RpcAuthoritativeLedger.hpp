#pragma once

#include <string>
#include <vector>

#include "providers/IAuthoritativeLedger.hpp"

namespace ddns::providers {

class JsonRpcClient;

/// Registry ledger reached through a JSON-RPC gateway.
/// Methods: ledger_currentHeight, registry_queryUpdateEvents,
/// registry_queryRegisterEvents, registry_getDomain.
class RpcAuthoritativeLedger : public IAuthoritativeLedger {
 public:
  explicit RpcAuthoritativeLedger(JsonRpcClient& jrcClient);
  ~RpcAuthoritativeLedger() override;

  std::string name() const override;
  uint64_t currentHeight() override;
  std::vector<common::UpdateEvent> queryUpdateEvents(uint64_t uFromHeight,
                                                     uint64_t uToHeight) override;
  std::vector<common::RegisterEvent> queryRegisterEvents(uint64_t uFromHeight,
                                                         uint64_t uToHeight) override;
  common::DomainRecordSet getDomainRecord(const std::string& sDomainKey) override;

 private:
  JsonRpcClient& _jrcClient;
};

}  // namespace ddns::providers
