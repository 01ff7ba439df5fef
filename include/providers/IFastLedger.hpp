#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "common/Types.hpp"

namespace ddns::providers {

/// Read/write surface of the fast resolver ledger (L2).
/// Implementations throw common::LedgerError on transport or RPC failure and
/// common::ValidationError when batch arrays are malformed.
class IFastLedger {
 public:
  virtual ~IFastLedger() = default;

  virtual std::string name() const = 0;

  virtual common::FastRecord getRecord(const std::string& sDomainKey,
                                       const std::string& sType) = 0;

  virtual common::FastBatch getBatchRecords(const std::string& sDomainKey,
                                            const std::vector<std::string>& vTypes) = 0;

  /// Write all (type, value, ttl) triples for one domain atomically.
  /// Returns a confirmation id for awaitConfirmations().
  virtual std::string submitBatchWrite(const std::string& sDomainKey,
                                       const std::vector<std::string>& vTypes,
                                       const std::vector<std::string>& vValues,
                                       const std::vector<uint32_t>& vTtls) = 0;

  /// Block until the write identified by sConfirmationId is iDepth deep.
  virtual void awaitConfirmations(const std::string& sConfirmationId, int iDepth) = 0;
};

}  // namespace ddns::providers
