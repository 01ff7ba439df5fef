#include "providers/ContentHashDecoder.hpp"

#include "common/DomainHash.hpp"
#include "common/Errors.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <string_view>

namespace ddns::providers {

namespace {

constexpr const char* kBase58Alphabet =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

// ipfs-ns namespace (0xe3 as varint), CIDv1, dag-pb codec
constexpr uint8_t kIpfsNsPrefix[] = {0xe3, 0x01, 0x01, 0x70};
constexpr uint8_t kSha256Code = 0x12;
constexpr uint8_t kSha256Length = 0x20;
constexpr size_t kCidV0Length = 46;

int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // anonymous namespace

ContentHashDecoder::ContentHashDecoder() = default;
ContentHashDecoder::~ContentHashDecoder() = default;

std::string ContentHashDecoder::base58Encode(const std::vector<uint8_t>& vBytes) {
  size_t nZeroes = 0;
  while (nZeroes < vBytes.size() && vBytes[nZeroes] == 0) {
    ++nZeroes;
  }

  // log(256) / log(58) ~ 1.365, rounded up
  std::vector<uint8_t> vDigits((vBytes.size() - nZeroes) * 138 / 100 + 1, 0);
  size_t nLength = 0;
  for (size_t i = nZeroes; i < vBytes.size(); ++i) {
    int iCarry = vBytes[i];
    size_t j = 0;
    for (auto it = vDigits.rbegin(); (iCarry != 0 || j < nLength) && it != vDigits.rend();
         ++it, ++j) {
      iCarry += 256 * (*it);
      *it = static_cast<uint8_t>(iCarry % 58);
      iCarry /= 58;
    }
    nLength = j;
  }

  auto it = vDigits.begin() + static_cast<std::ptrdiff_t>(vDigits.size() - nLength);
  while (it != vDigits.end() && *it == 0) {
    ++it;
  }

  std::string sOut(nZeroes, '1');
  for (; it != vDigits.end(); ++it) {
    sOut += kBase58Alphabet[*it];
  }
  return sOut;
}

std::vector<uint8_t> ContentHashDecoder::hexToBytes(const std::string& sHex) {
  if (sHex.size() % 2 != 0) {
    throw common::ContentDecodeError("invalid_content_ref",
                                     "Content reference has odd hex length");
  }
  std::vector<uint8_t> vBytes;
  vBytes.reserve(sHex.size() / 2);
  for (size_t i = 0; i < sHex.size(); i += 2) {
    const int iHi = hexValue(sHex[i]);
    const int iLo = hexValue(sHex[i + 1]);
    if (iHi < 0 || iLo < 0) {
      throw common::ContentDecodeError("invalid_content_ref",
                                       "Content reference contains non-hex characters");
    }
    vBytes.push_back(static_cast<uint8_t>((iHi << 4) | iLo));
  }
  return vBytes;
}

std::string ContentHashDecoder::decode(const std::string& sContentRef) const {
  if (common::DomainHash::isZero(sContentRef)) {
    throw common::ContentDecodeError("empty_content_ref", "Content reference is empty");
  }

  std::string_view svRef(sContentRef);
  if (svRef.starts_with("0x") || svRef.starts_with("0X")) {
    const auto vBytes = hexToBytes(std::string(svRef.substr(2)));

    std::vector<uint8_t> vMultihash;
    if (vBytes.size() == 38 &&
        std::equal(std::begin(kIpfsNsPrefix), std::end(kIpfsNsPrefix), vBytes.begin()) &&
        vBytes[4] == kSha256Code && vBytes[5] == kSha256Length) {
      vMultihash.assign(vBytes.begin() + 4, vBytes.end());
    } else if (vBytes.size() == 32) {
      vMultihash = {kSha256Code, kSha256Length};
      vMultihash.insert(vMultihash.end(), vBytes.begin(), vBytes.end());
    } else {
      throw common::ContentDecodeError(
          "unsupported_content_ref",
          "Unsupported content reference encoding (" + std::to_string(vBytes.size()) +
              " bytes)");
    }
    return base58Encode(vMultihash);
  }

  if (svRef.starts_with("ipfs://")) {
    svRef.remove_prefix(7);
  } else if (svRef.starts_with("/ipfs/")) {
    svRef.remove_prefix(6);
  }

  if ((svRef.starts_with("Qm") && svRef.size() == kCidV0Length) ||
      (svRef.starts_with("b") && svRef.size() > kCidV0Length)) {
    return std::string(svRef);
  }

  throw common::ContentDecodeError("unsupported_content_ref",
                                   "Unrecognized content reference: " + sContentRef);
}

}  // namespace ddns::providers
