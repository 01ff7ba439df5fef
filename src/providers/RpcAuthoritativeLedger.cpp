#include "providers/RpcAuthoritativeLedger.hpp"

#include "common/Errors.hpp"
#include "providers/JsonRpcClient.hpp"

#include <nlohmann/json.hpp>

namespace ddns::providers {

namespace {

/// Ledger gateways report integers either as JSON numbers or "0x" hex strings.
int64_t asInteger(const nlohmann::json& jValue, const char* pField) {
  if (jValue.is_number_integer()) {
    return jValue.get<int64_t>();
  }
  if (jValue.is_string()) {
    const auto sValue = jValue.get<std::string>();
    try {
      if (sValue.rfind("0x", 0) == 0) {
        return static_cast<int64_t>(std::stoull(sValue.substr(2), nullptr, 16));
      }
      return std::stoll(sValue);
    } catch (const std::exception&) {
      throw common::LedgerError("rpc_malformed_response",
                                std::string("Field '") + pField + "' is not an integer: " +
                                    sValue);
    }
  }
  throw common::LedgerError("rpc_malformed_response",
                            std::string("Field '") + pField + "' is not an integer");
}

std::string requireString(const nlohmann::json& jObj, const char* pField) {
  if (!jObj.is_object() || !jObj.contains(pField) || !jObj[pField].is_string()) {
    throw common::LedgerError("rpc_malformed_response",
                              std::string("Field '") + pField + "' missing or not a string");
  }
  return jObj[pField].get<std::string>();
}

void requireArray(const nlohmann::json& jResult, const char* pMethod) {
  if (!jResult.is_array()) {
    throw common::LedgerError("rpc_malformed_response",
                              std::string(pMethod) + ": result is not an array");
  }
}

}  // anonymous namespace

RpcAuthoritativeLedger::RpcAuthoritativeLedger(JsonRpcClient& jrcClient)
    : _jrcClient(jrcClient) {}

RpcAuthoritativeLedger::~RpcAuthoritativeLedger() = default;

std::string RpcAuthoritativeLedger::name() const { return "rpc-registry"; }

uint64_t RpcAuthoritativeLedger::currentHeight() {
  auto jResult = _jrcClient.call("ledger_currentHeight", nlohmann::json::array());
  return static_cast<uint64_t>(asInteger(jResult, "height"));
}

std::vector<common::UpdateEvent> RpcAuthoritativeLedger::queryUpdateEvents(uint64_t uFromHeight,
                                                                           uint64_t uToHeight) {
  auto jResult = _jrcClient.call("registry_queryUpdateEvents",
                                 {{"fromHeight", uFromHeight}, {"toHeight", uToHeight}});
  requireArray(jResult, "registry_queryUpdateEvents");

  std::vector<common::UpdateEvent> vEvents;
  vEvents.reserve(jResult.size());
  for (const auto& jEvent : jResult) {
    common::UpdateEvent ue;
    ue.sDomainKey = requireString(jEvent, "domainKey");
    ue.sContentRef = requireString(jEvent, "contentRef");
    ue.uHeight = static_cast<uint64_t>(asInteger(jEvent.value("height", nlohmann::json()),
                                                 "height"));
    vEvents.push_back(std::move(ue));
  }
  return vEvents;
}

std::vector<common::RegisterEvent> RpcAuthoritativeLedger::queryRegisterEvents(
    uint64_t uFromHeight, uint64_t uToHeight) {
  auto jResult = _jrcClient.call("registry_queryRegisterEvents",
                                 {{"fromHeight", uFromHeight}, {"toHeight", uToHeight}});
  requireArray(jResult, "registry_queryRegisterEvents");

  std::vector<common::RegisterEvent> vEvents;
  vEvents.reserve(jResult.size());
  for (const auto& jEvent : jResult) {
    common::RegisterEvent re;
    re.sDomainKey = requireString(jEvent, "domainKey");
    re.uHeight = static_cast<uint64_t>(asInteger(jEvent.value("height", nlohmann::json()),
                                                 "height"));
    vEvents.push_back(std::move(re));
  }
  return vEvents;
}

common::DomainRecordSet RpcAuthoritativeLedger::getDomainRecord(const std::string& sDomainKey) {
  auto jResult = _jrcClient.call("registry_getDomain", {{"domainKey", sDomainKey}});
  if (!jResult.is_object()) {
    throw common::LedgerError("rpc_malformed_response",
                              "registry_getDomain: result is not an object");
  }

  common::DomainRecordSet drs;
  drs.sOwner = jResult.value("owner", "");
  drs.sContentRef = jResult.value("contentRef", "");
  drs.iLastUpdated = asInteger(jResult.value("lastUpdated", nlohmann::json(0)), "lastUpdated");
  drs.iExpiry = asInteger(jResult.value("expiry", nlohmann::json(0)), "expiry");
  return drs;
}

}  // namespace ddns::providers
