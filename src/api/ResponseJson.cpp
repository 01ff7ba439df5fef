#include "api/ResponseJson.hpp"

#include "dal/SyncStateRepository.hpp"

namespace ddns::api {

nlohmann::json toJson(const common::BridgeStats& bs) {
  return {
      {"events_processed", bs.uEventsProcessed},
      {"updates_synced", bs.uUpdatesSynced},
      {"errors", bs.uErrors},
      {"poll_errors", bs.uPollErrors},
      {"content_retrieval_errors", bs.uContentRetrievalErrors},
      {"fast_submission_errors", bs.uFastSubmissionErrors},
      {"retries", bs.uRetries},
      {"abandoned_tasks", bs.uAbandonedTasks},
      {"last_processed_height", bs.uLastProcessedHeight},
      {"queue_size", bs.nQueueSize},
      {"uptime_seconds", bs.iUptimeSeconds},
      {"running", bs.bRunning},
  };
}

nlohmann::json toJson(const common::ResolverStats& rst) {
  return {
      {"total_queries", rst.uTotalQueries},
      {"fast_queries", rst.uFastQueries},
      {"authoritative_queries", rst.uAuthQueries},
      {"cache_hits", rst.uCacheHits},
      {"fast_errors", rst.uFastErrors},
      {"authoritative_errors", rst.uAuthErrors},
      {"verification_mismatches", rst.uVerificationMismatches},
      {"fallbacks", rst.uFallbacks},
      {"fast_avg_latency_ms", rst.dFastAvgLatencyMs},
      {"authoritative_avg_latency_ms", rst.dAuthAvgLatencyMs},
      {"cache_hit_rate", rst.dCacheHitRate},
      {"latency_reduction", rst.dLatencyReduction},
  };
}

nlohmann::json toJson(const common::ResolveResult& res) {
  nlohmann::json j = {
      {"value", res.oValue ? nlohmann::json(*res.oValue) : nlohmann::json(nullptr)},
      {"ttl", res.uTtl},
      {"source", common::toString(res.source)},
      {"latency_ms", res.dLatencyMs},
  };
  if (!res.sContentRef.empty()) j["content_ref"] = res.sContentRef;
  if (res.oError) j["error"] = *res.oError;
  if (!res.sOwner.empty()) {
    j["owner"] = res.sOwner;
    j["last_updated"] = res.iLastUpdated;
    j["expiry"] = res.iExpiry;
  }
  if (res.iTimestamp != 0) j["timestamp"] = res.iTimestamp;
  return j;
}

nlohmann::json toJson(const common::BatchResolveResult& bres) {
  nlohmann::json jValues = nlohmann::json::array();
  for (const auto& oValue : bres.vValues) {
    jValues.push_back(oValue ? nlohmann::json(*oValue) : nlohmann::json(nullptr));
  }
  nlohmann::json j = {
      {"values", jValues},
      {"ttls", bres.vTtls},
      {"source", common::toString(bres.source)},
      {"latency_ms", bres.dLatencyMs},
  };
  if (!bres.sContentRef.empty()) j["content_ref"] = bres.sContentRef;
  if (bres.oError) j["error"] = *bres.oError;
  return j;
}

nlohmann::json toJson(const dal::DeadLetterRow& dlr) {
  return {
      {"id", dlr.iId},
      {"kind", dlr.stTask.kind == common::SyncTaskKind::Register ? "register" : "update"},
      {"domain_key", dlr.stTask.sDomainKey},
      {"content_ref", dlr.stTask.sContentRef},
      {"source_height", dlr.stTask.uSourceHeight},
      {"retry_count", dlr.stTask.iRetryCount},
      {"reason", dlr.sReason},
      {"abandoned_at", dlr.sAbandonedAt},
  };
}

}  // namespace ddns::api
