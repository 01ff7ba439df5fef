#pragma once

#include <string>

namespace ddns::providers {

/// Turns a chain-encoded content reference into a content-store locator.
class IContentRefDecoder {
 public:
  virtual ~IContentRefDecoder() = default;

  /// Throws common::ContentDecodeError for references it cannot decode.
  virtual std::string decode(const std::string& sContentRef) const = 0;
};

}  // namespace ddns::providers
