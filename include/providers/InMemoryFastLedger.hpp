#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "providers/IFastLedger.hpp"

namespace ddns::providers {

/// In-process resolver ledger for memory mode and tests.
/// Writes are last-write-wins per (domain, type); every accepted batch gets a
/// confirmation id that awaitConfirmations() recognises.
/// Class abbreviation: imfl
class InMemoryFastLedger : public IFastLedger {
 public:
  InMemoryFastLedger();
  ~InMemoryFastLedger() override;

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

  // ── Resolver writes ─────────────────────────────────────────────────────

  void setRecord(const std::string& sDomainKey, const std::string& sType,
                 const std::string& sValue, uint32_t uTtl);

  /// Throws ValidationError when the arrays differ in length.
  void setBatchRecords(const std::string& sDomainKey, const std::vector<std::string>& vTypes,
                       const std::vector<std::string>& vValues,
                       const std::vector<uint32_t>& vTtls);

  /// Returns false when no such record existed.
  bool removeRecord(const std::string& sDomainKey, const std::string& sType);

  /// Record types currently set for the domain, in first-write order.
  std::vector<std::string> getAllRecordTypes(const std::string& sDomainKey) const;

  /// Content reference reported alongside reads for the domain (empty = none).
  void setContentRef(const std::string& sDomainKey, const std::string& sContentRef);

  /// Number of accepted submitBatchWrite() calls.
  uint64_t writeCount() const;

 private:
  struct Entry {
    std::string sValue;
    uint32_t uTtl = 0;
    int64_t iTimestamp = 0;
  };

  struct DomainRecords {
    std::map<std::string, Entry> mEntries;
    std::vector<std::string> vTypeOrder;
    std::string sContentRef;
  };

  void storeLocked(const std::string& sDomainKey, const std::string& sType,
                   const std::string& sValue, uint32_t uTtl, int64_t iTimestamp);

  mutable std::mutex _mtx;
  std::map<std::string, DomainRecords> _mDomains;
  std::set<std::string> _setConfirmationIds;
  uint64_t _uWriteCount = 0;
};

}  // namespace ddns::providers
