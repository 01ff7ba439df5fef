#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ddns::common {

/// TTL applied when a record source does not specify one.
constexpr uint32_t kDefaultTtlSeconds = 3600;

/// Authoritative snapshot of one domain as held by the registry ledger.
/// Class abbreviation: drs
struct DomainRecordSet {
  std::string sOwner;        // empty or all-zero address = unregistered
  std::string sContentRef;   // chain-encoded content reference, may be empty
  int64_t iLastUpdated = 0;  // unix seconds
  int64_t iExpiry = 0;       // unix seconds
};

/// One DNS-style record.
/// Class abbreviation: rr
struct ResolvedRecord {
  std::string sType;
  std::string sValue;
  uint32_t uTtl = kDefaultTtlSeconds;
  int64_t iTimestamp = 0;
};

/// Content-store document for one domain. Types keep document order and
/// every value is already in canonical string form.
/// Class abbreviation: rs
struct RecordSet {
  std::string sDomain;
  std::vector<std::pair<std::string, std::vector<std::string>>> vRecords;
  uint32_t uTtl = kDefaultTtlSeconds;
  int64_t iTimestamp = 0;
  bool bDegraded = false;  // placeholder built after a failed retrieval
};

/// Kind of change observed on the authoritative ledger.
enum class SyncTaskKind { Update, Register };

/// A unit of pending bridge work.
/// Class abbreviation: st
struct SyncTask {
  SyncTaskKind kind = SyncTaskKind::Update;
  std::string sDomainKey;
  std::string sContentRef;
  uint64_t uSourceHeight = 0;
  int iRetryCount = 0;
  std::chrono::system_clock::time_point tpNotBefore{};
};

/// "content updated" event from the registry ledger.
/// Class abbreviation: ue
struct UpdateEvent {
  std::string sDomainKey;
  std::string sContentRef;
  uint64_t uHeight = 0;
};

/// "newly registered" event from the registry ledger.
/// Class abbreviation: re
struct RegisterEvent {
  std::string sDomainKey;
  uint64_t uHeight = 0;
};

/// Single record as returned by the fast ledger. Empty sValue = no record.
/// Class abbreviation: fr
struct FastRecord {
  std::string sValue;
  uint32_t uTtl = 0;
  int64_t iTimestamp = 0;
  std::string sContentRef;  // content reference the record was synced from, if reported
};

/// Batch read result from the fast ledger, index-aligned with the requested types.
/// Class abbreviation: fb
struct FastBatch {
  std::vector<std::string> vValues;
  std::vector<uint32_t> vTtls;
  std::vector<int64_t> vTimestamps;
  std::string sContentRef;
};

/// Parallel arrays submitted to the fast ledger in one batched write.
/// Class abbreviation: bw
struct BatchWrite {
  std::vector<std::string> vTypes;
  std::vector<std::string> vValues;
  std::vector<uint32_t> vTtls;
};

/// Which tier produced a resolution result.
enum class ResolutionSource { Cache, Fast, Authoritative, Fallback, Error };

inline const char* toString(ResolutionSource source) {
  switch (source) {
    case ResolutionSource::Cache: return "cache";
    case ResolutionSource::Fast: return "fast";
    case ResolutionSource::Authoritative: return "authoritative";
    case ResolutionSource::Fallback: return "fallback";
    case ResolutionSource::Error: return "error";
  }
  return "unknown";
}

/// Resolution cache entry.
/// Class abbreviation: ce
struct CacheEntry {
  std::string sValue;
  uint32_t uTtl = kDefaultTtlSeconds;
  std::string sContentRef;
  ResolutionSource source = ResolutionSource::Fast;
  std::chrono::system_clock::time_point tpStoredAt;
};

/// Per-call resolution options.
/// Class abbreviation: ro
struct ResolveOptions {
  bool bForceAuthoritative = false;
  bool bForceFast = false;
  bool bSkipCache = false;
  std::optional<bool> oVerify;  // unset = engine default
};

/// Outcome of a single-type resolution. Never an exception.
/// Class abbreviation: res
struct ResolveResult {
  std::optional<std::string> oValue;
  uint32_t uTtl = 0;
  ResolutionSource source = ResolutionSource::Error;
  std::string sContentRef;
  std::optional<std::string> oError;
  std::string sOwner;
  int64_t iLastUpdated = 0;
  int64_t iExpiry = 0;
  int64_t iTimestamp = 0;
  double dLatencyMs = 0.0;
};

/// Outcome of a multi-type resolution, index-aligned with the requested types.
/// Class abbreviation: bres
struct BatchResolveResult {
  std::vector<std::optional<std::string>> vValues;
  std::vector<uint32_t> vTtls;
  ResolutionSource source = ResolutionSource::Error;
  std::string sContentRef;
  std::optional<std::string> oError;
  double dLatencyMs = 0.0;
};

/// Bridge counters exposed on the stats endpoint.
/// Class abbreviation: bs
struct BridgeStats {
  uint64_t uEventsProcessed = 0;
  uint64_t uUpdatesSynced = 0;
  uint64_t uErrors = 0;
  uint64_t uPollErrors = 0;
  uint64_t uContentRetrievalErrors = 0;
  uint64_t uFastSubmissionErrors = 0;
  uint64_t uRetries = 0;
  uint64_t uAbandonedTasks = 0;
  uint64_t uLastProcessedHeight = 0;
  size_t nQueueSize = 0;
  int64_t iUptimeSeconds = 0;
  bool bRunning = false;
};

/// Resolver counters plus derived metrics.
/// Class abbreviation: rst
struct ResolverStats {
  uint64_t uTotalQueries = 0;
  uint64_t uFastQueries = 0;
  uint64_t uAuthQueries = 0;
  uint64_t uCacheHits = 0;
  uint64_t uFastErrors = 0;
  uint64_t uAuthErrors = 0;
  uint64_t uVerificationMismatches = 0;
  uint64_t uFallbacks = 0;
  double dFastLatencySumMs = 0.0;
  double dAuthLatencySumMs = 0.0;

  double dFastAvgLatencyMs = 0.0;
  double dAuthAvgLatencyMs = 0.0;
  double dCacheHitRate = 0.0;      // percent
  double dLatencyReduction = 0.0;  // percent, fast vs authoritative
};

}  // namespace ddns::common
