#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "common/Errors.hpp"

namespace ddns::providers {

/// Reject malformed batch writes before they reach a ledger.
/// Throws ValidationError on empty or length-mismatched arrays or an empty type.
inline void validateBatchWrite(const std::string& sDomainKey,
                               const std::vector<std::string>& vTypes,
                               const std::vector<std::string>& vValues,
                               const std::vector<uint32_t>& vTtls) {
  if (sDomainKey.empty()) {
    throw common::ValidationError("invalid_domain_key", "Batch write has an empty domain key");
  }
  if (vTypes.empty()) {
    throw common::ValidationError("empty_batch", "Batch write has no records");
  }
  if (vTypes.size() != vValues.size() || vTypes.size() != vTtls.size()) {
    throw common::ValidationError(
        "batch_length_mismatch",
        "Batch arrays differ in length: types=" + std::to_string(vTypes.size()) +
            " values=" + std::to_string(vValues.size()) +
            " ttls=" + std::to_string(vTtls.size()));
  }
  for (const auto& sType : vTypes) {
    if (sType.empty()) {
      throw common::ValidationError("invalid_record_type", "Batch write has an empty record type");
    }
  }
}

}  // namespace ddns::providers
