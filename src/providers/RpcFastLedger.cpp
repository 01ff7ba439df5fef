#include "providers/RpcFastLedger.hpp"

#include "common/Errors.hpp"
#include "providers/BatchValidation.hpp"
#include "providers/JsonRpcClient.hpp"

#include <nlohmann/json.hpp>

namespace ddns::providers {

namespace {

/// Missing and null fields both read as the default; gateways send null for unset slots
template <typename T>
T fieldOr(const nlohmann::json& jObj, const char* pField, T tDefault) {
  auto it = jObj.find(pField);
  if (it == jObj.end() || it->is_null()) {
    return tDefault;
  }
  return it->template get<T>();
}

template <typename T>
std::vector<T> arrayField(const nlohmann::json& jObj, const char* pField, size_t nExpected) {
  if (!jObj.contains(pField) || !jObj[pField].is_array()) {
    throw common::LedgerError("rpc_malformed_response",
                              std::string("Field '") + pField + "' missing or not an array");
  }
  const auto& jArr = jObj[pField];
  if (jArr.size() != nExpected) {
    throw common::ValidationError(
        "batch_length_mismatch",
        std::string("Field '") + pField + "' has " + std::to_string(jArr.size()) +
            " entries, expected " + std::to_string(nExpected));
  }
  std::vector<T> vOut;
  vOut.reserve(jArr.size());
  for (const auto& jEl : jArr) {
    vOut.push_back(jEl.is_null() ? T{} : jEl.template get<T>());
  }
  return vOut;
}

}  // anonymous namespace

RpcFastLedger::RpcFastLedger(JsonRpcClient& jrcClient) : _jrcClient(jrcClient) {}

RpcFastLedger::~RpcFastLedger() = default;

std::string RpcFastLedger::name() const { return "rpc-resolver"; }

common::FastRecord RpcFastLedger::getRecord(const std::string& sDomainKey,
                                            const std::string& sType) {
  auto jResult = _jrcClient.call("resolver_getRecord",
                                 {{"domainKey", sDomainKey}, {"type", sType}});
  return parseRecord(jResult);
}

common::FastBatch RpcFastLedger::getBatchRecords(const std::string& sDomainKey,
                                                 const std::vector<std::string>& vTypes) {
  auto jResult = _jrcClient.call("resolver_getBatchRecords",
                                 {{"domainKey", sDomainKey}, {"types", vTypes}});
  return parseBatch(jResult, vTypes.size());
}

// ── Result parsing ─────────────────────────────────────────────────────────

common::FastRecord RpcFastLedger::parseRecord(const nlohmann::json& jResult) {
  if (!jResult.is_object()) {
    throw common::LedgerError("rpc_malformed_response",
                              "resolver_getRecord: result is not an object");
  }

  try {
    common::FastRecord fr;
    fr.sValue = fieldOr<std::string>(jResult, "value", "");
    fr.uTtl = fieldOr<uint32_t>(jResult, "ttl", 0u);
    fr.iTimestamp = fieldOr<int64_t>(jResult, "timestamp", 0);
    fr.sContentRef = fieldOr<std::string>(jResult, "contentRef", "");
    return fr;
  } catch (const nlohmann::json::exception& ex) {
    throw common::LedgerError("rpc_malformed_response",
                              std::string("resolver_getRecord: ") + ex.what());
  }
}

common::FastBatch RpcFastLedger::parseBatch(const nlohmann::json& jResult, size_t nTypes) {
  if (!jResult.is_object()) {
    throw common::LedgerError("rpc_malformed_response",
                              "resolver_getBatchRecords: result is not an object");
  }

  try {
    common::FastBatch fb;
    fb.vValues = arrayField<std::string>(jResult, "values", nTypes);
    fb.vTtls = arrayField<uint32_t>(jResult, "ttls", nTypes);
    fb.vTimestamps = arrayField<int64_t>(jResult, "timestamps", nTypes);
    fb.sContentRef = fieldOr<std::string>(jResult, "contentRef", "");
    return fb;
  } catch (const nlohmann::json::exception& ex) {
    throw common::LedgerError("rpc_malformed_response",
                              std::string("resolver_getBatchRecords: ") + ex.what());
  }
}

std::string RpcFastLedger::submitBatchWrite(const std::string& sDomainKey,
                                            const std::vector<std::string>& vTypes,
                                            const std::vector<std::string>& vValues,
                                            const std::vector<uint32_t>& vTtls) {
  validateBatchWrite(sDomainKey, vTypes, vValues, vTtls);

  auto jResult = _jrcClient.call("resolver_setBatchRecords",
                                 {{"domainKey", sDomainKey},
                                  {"types", vTypes},
                                  {"values", vValues},
                                  {"ttls", vTtls}});
  if (jResult.is_string()) {
    return jResult.get<std::string>();
  }
  if (jResult.is_object() && jResult.contains("txId") && jResult["txId"].is_string()) {
    return jResult["txId"].get<std::string>();
  }
  throw common::LedgerError("rpc_malformed_response",
                            "resolver_setBatchRecords: no confirmation id in result");
}

void RpcFastLedger::awaitConfirmations(const std::string& sConfirmationId, int iDepth) {
  auto jResult = _jrcClient.call("resolver_awaitConfirmations",
                                 {{"txId", sConfirmationId}, {"confirmations", iDepth}});
  // Gateways answer true, or an object carrying a "confirmed" flag
  const bool bConfirmed = jResult.is_boolean()
                              ? jResult.get<bool>()
                              : (jResult.is_object() && jResult.value("confirmed", false));
  if (!bConfirmed) {
    throw common::LedgerError("write_not_confirmed",
                              "Write " + sConfirmationId + " not confirmed at depth " +
                                  std::to_string(iDepth));
  }
}

}  // namespace ddns::providers
