#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "common/Types.hpp"

namespace ddns::providers {

/// Read surface of the authoritative registry ledger (L1).
/// Implementations throw common::LedgerError on transport or RPC failure.
class IAuthoritativeLedger {
 public:
  virtual ~IAuthoritativeLedger() = default;

  virtual std::string name() const = 0;
  virtual uint64_t currentHeight() = 0;

  /// "content updated" events with fromHeight <= height <= toHeight.
  virtual std::vector<common::UpdateEvent> queryUpdateEvents(uint64_t uFromHeight,
                                                             uint64_t uToHeight) = 0;

  /// "newly registered" events with fromHeight <= height <= toHeight.
  virtual std::vector<common::RegisterEvent> queryRegisterEvents(uint64_t uFromHeight,
                                                                 uint64_t uToHeight) = 0;

  virtual common::DomainRecordSet getDomainRecord(const std::string& sDomainKey) = 0;
};

}  // namespace ddns::providers
