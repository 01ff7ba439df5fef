#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "common/Types.hpp"

namespace ddns::providers {
class IContentRefDecoder;
class IContentStore;
}  // namespace ddns::providers

namespace ddns::core {

/// Fetches and parses the record set a content reference points at.
/// Class abbreviation: cr
class ContentResolver {
 public:
  /// Record type of the marker written on the degraded path.
  static constexpr const char* kSourceMarkerType = "_ddns-source";
  static constexpr const char* kSourceFallback = "fallback";
  static constexpr const char* kSourceVerified = "verified";

  ContentResolver(providers::IContentStore& csStore,
                  const providers::IContentRefDecoder& crdDecoder);
  ~ContentResolver();

  /// Decode sContentRef, fetch the document and parse it.
  /// Throws ContentDecodeError, NotFoundError or ContentStoreError.
  common::RecordSet fetch(const std::string& sContentRef);

  /// Parse a record set document. Record types keep document order;
  /// structured values are serialized as compact JSON with sorted keys.
  /// Throws ContentDecodeError on malformed documents.
  static common::RecordSet parseRecordSet(const std::string& sDocument);

  /// Placeholder set carrying only the fallback marker.
  static common::RecordSet degraded(const std::string& sDomain, uint32_t uFallbackTtl);

  /// Values for sType, or nullptr when the set has no such type.
  static const std::vector<std::string>* findType(const common::RecordSet& rs,
                                                  const std::string& sType);

 private:
  providers::IContentStore& _csStore;
  const providers::IContentRefDecoder& _crdDecoder;
};

}  // namespace ddns::core
