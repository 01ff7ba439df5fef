#include "providers/InMemoryFastLedger.hpp"

#include <algorithm>
#include <chrono>

#include "common/Errors.hpp"
#include "providers/BatchValidation.hpp"

namespace ddns::providers {

namespace {

int64_t nowSeconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

}  // anonymous namespace

InMemoryFastLedger::InMemoryFastLedger() = default;

InMemoryFastLedger::~InMemoryFastLedger() = default;

std::string InMemoryFastLedger::name() const { return "memory-resolver"; }

void InMemoryFastLedger::storeLocked(const std::string& sDomainKey, const std::string& sType,
                                     const std::string& sValue, uint32_t uTtl,
                                     int64_t iTimestamp) {
  auto& dr = _mDomains[sDomainKey];
  auto [it, bInserted] = dr.mEntries.insert_or_assign(sType, Entry{sValue, uTtl, iTimestamp});
  if (bInserted) {
    dr.vTypeOrder.push_back(sType);
  }
}

common::FastRecord InMemoryFastLedger::getRecord(const std::string& sDomainKey,
                                                 const std::string& sType) {
  std::lock_guard<std::mutex> lock(_mtx);
  common::FastRecord fr;
  auto itDomain = _mDomains.find(sDomainKey);
  if (itDomain == _mDomains.end()) {
    return fr;
  }
  fr.sContentRef = itDomain->second.sContentRef;
  auto itEntry = itDomain->second.mEntries.find(sType);
  if (itEntry != itDomain->second.mEntries.end()) {
    fr.sValue = itEntry->second.sValue;
    fr.uTtl = itEntry->second.uTtl;
    fr.iTimestamp = itEntry->second.iTimestamp;
  }
  return fr;
}

common::FastBatch InMemoryFastLedger::getBatchRecords(const std::string& sDomainKey,
                                                      const std::vector<std::string>& vTypes) {
  std::lock_guard<std::mutex> lock(_mtx);
  common::FastBatch fb;
  fb.vValues.resize(vTypes.size());
  fb.vTtls.resize(vTypes.size(), 0);
  fb.vTimestamps.resize(vTypes.size(), 0);

  auto itDomain = _mDomains.find(sDomainKey);
  if (itDomain == _mDomains.end()) {
    return fb;
  }
  fb.sContentRef = itDomain->second.sContentRef;
  for (size_t i = 0; i < vTypes.size(); ++i) {
    auto itEntry = itDomain->second.mEntries.find(vTypes[i]);
    if (itEntry != itDomain->second.mEntries.end()) {
      fb.vValues[i] = itEntry->second.sValue;
      fb.vTtls[i] = itEntry->second.uTtl;
      fb.vTimestamps[i] = itEntry->second.iTimestamp;
    }
  }
  return fb;
}

std::string InMemoryFastLedger::submitBatchWrite(const std::string& sDomainKey,
                                                 const std::vector<std::string>& vTypes,
                                                 const std::vector<std::string>& vValues,
                                                 const std::vector<uint32_t>& vTtls) {
  validateBatchWrite(sDomainKey, vTypes, vValues, vTtls);

  std::lock_guard<std::mutex> lock(_mtx);
  const int64_t iNow = nowSeconds();
  for (size_t i = 0; i < vTypes.size(); ++i) {
    storeLocked(sDomainKey, vTypes[i], vValues[i], vTtls[i], iNow);
  }
  ++_uWriteCount;
  std::string sId = "mem-tx-" + std::to_string(_uWriteCount);
  _setConfirmationIds.insert(sId);
  return sId;
}

void InMemoryFastLedger::awaitConfirmations(const std::string& sConfirmationId, int /*iDepth*/) {
  std::lock_guard<std::mutex> lock(_mtx);
  if (_setConfirmationIds.count(sConfirmationId) == 0) {
    throw common::LedgerError("unknown_confirmation",
                              "No write with confirmation id " + sConfirmationId);
  }
}

void InMemoryFastLedger::setRecord(const std::string& sDomainKey, const std::string& sType,
                                   const std::string& sValue, uint32_t uTtl) {
  if (sType.empty()) {
    throw common::ValidationError("invalid_record_type", "Record type is empty");
  }
  std::lock_guard<std::mutex> lock(_mtx);
  storeLocked(sDomainKey, sType, sValue, uTtl, nowSeconds());
}

void InMemoryFastLedger::setBatchRecords(const std::string& sDomainKey,
                                         const std::vector<std::string>& vTypes,
                                         const std::vector<std::string>& vValues,
                                         const std::vector<uint32_t>& vTtls) {
  validateBatchWrite(sDomainKey, vTypes, vValues, vTtls);

  std::lock_guard<std::mutex> lock(_mtx);
  const int64_t iNow = nowSeconds();
  for (size_t i = 0; i < vTypes.size(); ++i) {
    storeLocked(sDomainKey, vTypes[i], vValues[i], vTtls[i], iNow);
  }
}

bool InMemoryFastLedger::removeRecord(const std::string& sDomainKey, const std::string& sType) {
  std::lock_guard<std::mutex> lock(_mtx);
  auto itDomain = _mDomains.find(sDomainKey);
  if (itDomain == _mDomains.end()) {
    return false;
  }
  auto& dr = itDomain->second;
  if (dr.mEntries.erase(sType) == 0) {
    return false;
  }
  dr.vTypeOrder.erase(std::remove(dr.vTypeOrder.begin(), dr.vTypeOrder.end(), sType),
                      dr.vTypeOrder.end());
  return true;
}

std::vector<std::string> InMemoryFastLedger::getAllRecordTypes(
    const std::string& sDomainKey) const {
  std::lock_guard<std::mutex> lock(_mtx);
  auto it = _mDomains.find(sDomainKey);
  if (it == _mDomains.end()) {
    return {};
  }
  return it->second.vTypeOrder;
}

void InMemoryFastLedger::setContentRef(const std::string& sDomainKey,
                                       const std::string& sContentRef) {
  std::lock_guard<std::mutex> lock(_mtx);
  _mDomains[sDomainKey].sContentRef = sContentRef;
}

uint64_t InMemoryFastLedger::writeCount() const {
  std::lock_guard<std::mutex> lock(_mtx);
  return _uWriteCount;
}

}  // namespace ddns::providers
