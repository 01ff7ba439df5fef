#pragma once

#include <string>

namespace ddns::common {

/// Stable domain identity used as the ledger key.
/// Class abbreviation: N/A (static interface)
class DomainHash {
 public:
  /// "0x" + lowercase hex SHA3-256 of the UTF-8 domain name.
  static std::string compute(const std::string& sDomainName);

  /// True if sRef is empty, "0x", or a hex string made only of zeros.
  static bool isZero(const std::string& sRef);
};

}  // namespace ddns::common
