#include "core/ContentResolver.hpp"

#include <nlohmann/json.hpp>

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "providers/IContentRefDecoder.hpp"
#include "providers/IContentStore.hpp"

namespace ddns::core {

namespace {

/// Strings pass through untouched; everything else becomes canonical JSON.
/// Re-parsing into nlohmann::json (std::map backed) sorts object keys.
std::string canonicalValue(const nlohmann::ordered_json& jValue) {
  if (jValue.is_string()) {
    return jValue.get<std::string>();
  }
  if (jValue.is_primitive()) {
    return jValue.dump();
  }
  return nlohmann::json::parse(jValue.dump()).dump();
}

}  // anonymous namespace

ContentResolver::ContentResolver(providers::IContentStore& csStore,
                                 const providers::IContentRefDecoder& crdDecoder)
    : _csStore(csStore), _crdDecoder(crdDecoder) {}

ContentResolver::~ContentResolver() = default;

common::RecordSet ContentResolver::fetch(const std::string& sContentRef) {
  const std::string sLocator = _crdDecoder.decode(sContentRef);
  common::Logger::get()->debug("Fetching record set {} from {}", sLocator, _csStore.name());
  return parseRecordSet(_csStore.fetch(sLocator));
}

common::RecordSet ContentResolver::parseRecordSet(const std::string& sDocument) {
  nlohmann::ordered_json jDoc;
  try {
    jDoc = nlohmann::ordered_json::parse(sDocument);
  } catch (const nlohmann::json::parse_error& ex) {
    throw common::ContentDecodeError("invalid_record_set",
                                     std::string("Record set is not valid JSON: ") + ex.what());
  }

  if (!jDoc.is_object() || !jDoc.contains("records") || !jDoc["records"].is_object()) {
    throw common::ContentDecodeError("invalid_record_set",
                                     "Record set has no 'records' object");
  }

  common::RecordSet rs;
  if (jDoc.contains("domain") && jDoc["domain"].is_string()) {
    rs.sDomain = jDoc["domain"].get<std::string>();
  }

  if (jDoc.contains("ttl") && !jDoc["ttl"].is_null()) {
    const auto& jTtl = jDoc["ttl"];
    if (!jTtl.is_number_integer() || jTtl.get<int64_t>() < 0 ||
        jTtl.get<int64_t>() > static_cast<int64_t>(UINT32_MAX)) {
      throw common::ContentDecodeError("invalid_record_set",
                                       "Record set 'ttl' is not a valid number of seconds");
    }
    // A zero ttl means "unspecified"
    const auto uTtl = jTtl.get<uint32_t>();
    rs.uTtl = uTtl == 0 ? common::kDefaultTtlSeconds : uTtl;
  }

  if (jDoc.contains("timestamp") && jDoc["timestamp"].is_number_integer()) {
    rs.iTimestamp = jDoc["timestamp"].get<int64_t>();
  }

  for (const auto& [sType, jValues] : jDoc["records"].items()) {
    std::vector<std::string> vValues;
    if (jValues.is_array()) {
      vValues.reserve(jValues.size());
      for (const auto& jValue : jValues) {
        vValues.push_back(canonicalValue(jValue));
      }
    } else {
      vValues.push_back(canonicalValue(jValues));
    }
    rs.vRecords.emplace_back(sType, std::move(vValues));
  }
  return rs;
}

common::RecordSet ContentResolver::degraded(const std::string& sDomain, uint32_t uFallbackTtl) {
  common::RecordSet rs;
  rs.sDomain = sDomain;
  rs.uTtl = uFallbackTtl;
  rs.bDegraded = true;
  rs.vRecords.emplace_back(kSourceMarkerType, std::vector<std::string>{kSourceFallback});
  return rs;
}

const std::vector<std::string>* ContentResolver::findType(const common::RecordSet& rs,
                                                          const std::string& sType) {
  for (const auto& [sRecordType, vValues] : rs.vRecords) {
    if (sRecordType == sType) {
      return &vValues;
    }
  }
  return nullptr;
}

}  // namespace ddns::core
