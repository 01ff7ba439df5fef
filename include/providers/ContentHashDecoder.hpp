#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "providers/IContentRefDecoder.hpp"

namespace ddns::providers {

/// Decodes registry content references into IPFS CIDv0 locators.
///
/// Accepted forms:
///   - EIP-1577 ipfs-ns hex: 0xe3 01 70 12 20 <32-byte sha2-256 digest>
///   - bare 32-byte hex digest (assumed sha2-256)
///   - textual CIDs ("Qm...", "bafy..."), optionally prefixed "ipfs://" or "/ipfs/"
/// Class abbreviation: chd
class ContentHashDecoder : public IContentRefDecoder {
 public:
  ContentHashDecoder();
  ~ContentHashDecoder() override;

  std::string decode(const std::string& sContentRef) const override;

  /// Bitcoin-alphabet base58 encoding, leading zero bytes become '1'.
  static std::string base58Encode(const std::vector<uint8_t>& vBytes);

 private:
  static std::vector<uint8_t> hexToBytes(const std::string& sHex);
};

}  // namespace ddns::providers
