#include "core/ResolutionEngine.hpp"

#include <algorithm>
#include <cctype>
#include <future>

#include "common/DomainHash.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/ContentResolver.hpp"
#include "core/ResolutionCache.hpp"
#include "core/ThreadPool.hpp"
#include "providers/IAuthoritativeLedger.hpp"
#include "providers/IFastLedger.hpp"

namespace ddns::core {

namespace {

using Clock = std::chrono::steady_clock;

double elapsedMs(Clock::time_point tpStart) {
  return std::chrono::duration<double, std::milli>(Clock::now() - tpStart).count();
}

int64_t nowSeconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

}  // anonymous namespace

ResolutionEngine::ResolutionEngine(providers::IAuthoritativeLedger& alLedger,
                                   providers::IFastLedger& flLedger,
                                   ContentResolver& crResolver, ResolutionCache& rcCache,
                                   Options opts, ThreadPool* pPool)
    : _alLedger(alLedger),
      _flLedger(flLedger),
      _crResolver(crResolver),
      _rcCache(rcCache),
      _opts(opts),
      _pPool(pPool) {
  if (_opts.iTierTimeoutMs > 0 && _pPool == nullptr) {
    throw std::invalid_argument("ResolutionEngine: a tier timeout needs a thread pool");
  }
}

ResolutionEngine::~ResolutionEngine() = default;

std::string ResolutionEngine::domainKeyFor(const std::string& sDomain) {
  const bool bIsKey = sDomain.size() == 66 && sDomain.rfind("0x", 0) == 0 &&
                      std::all_of(sDomain.begin() + 2, sDomain.end(), [](unsigned char c) {
                        return std::isxdigit(c) != 0;
                      });
  if (bIsKey) {
    std::string sKey = sDomain;
    std::transform(sKey.begin(), sKey.end(), sKey.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return sKey;
  }
  return common::DomainHash::compute(sDomain);
}

// ── Single-type resolution ─────────────────────────────────────────────────

common::ResolveResult ResolutionEngine::resolve(const std::string& sDomain,
                                                const std::string& sType,
                                                const common::ResolveOptions& ro) {
  const auto tpStart = Clock::now();
  auto spLog = common::Logger::get();
  {
    std::lock_guard<std::mutex> lock(_mtxStats);
    ++_rstStats.uTotalQueries;
  }

  common::ResolveResult res;
  try {
    const std::string sKey = domainKeyFor(sDomain);

    if (_opts.bUseCache && !ro.bSkipCache) {
      if (auto oEntry = _rcCache.get(sKey, sType)) {
        noteCacheHit();
        res.oValue = oEntry->sValue;
        res.uTtl = oEntry->uTtl;
        res.sContentRef = oEntry->sContentRef;
        res.source = common::ResolutionSource::Cache;
        res.dLatencyMs = elapsedMs(tpStart);
        return res;
      }
    }

    const bool bVerify = ro.oVerify.value_or(_opts.bVerifyWithAuthoritative);

    if (ro.bForceAuthoritative) {
      res = fromAuthoritative(readAuthoritative(sKey), sType);
    } else if (ro.bForceFast) {
      res = fromFast(readFast(sKey, sType));
    } else if (_opts.bPreferFast) {
      bool bFastOk = false;
      try {
        res = fromFast(readFast(sKey, sType));
        bFastOk = true;
      } catch (const std::exception& ex) {
        spLog->warn("Fast tier failed for {} {}, falling back to authoritative: {}", sDomain,
                    sType, ex.what());
        noteFallback();
        res = fromAuthoritative(readAuthoritative(sKey), sType);
      }

      if (bFastOk && bVerify && res.oValue) {
        try {
          const auto ar = readAuthoritative(sKey);
          auto resAuth = fromAuthoritative(ar, sType);
          if (resAuth.source == common::ResolutionSource::Fallback) {
            spLog->warn("Cannot verify {} {}: authoritative content unavailable", sDomain,
                        sType);
          } else {
            const bool bMismatch = res.sContentRef.empty()
                                       ? !holdsValue(ar, sType, res.oValue)
                                       : res.sContentRef != resAuth.sContentRef;
            if (bMismatch) {
              noteMismatch();
              spLog->warn("Fast and authoritative records disagree for {} {}, using "
                          "authoritative",
                          sDomain, sType);
              res = std::move(resAuth);
            }
          }
        } catch (const std::exception& ex) {
          spLog->warn("Verification read failed for {} {}, keeping fast result: {}", sDomain,
                      sType, ex.what());
        }
      }
    } else {
      res = fromAuthoritative(readAuthoritative(sKey), sType);
    }

    if (_opts.bUseCache && res.oValue) {
      common::CacheEntry ce;
      ce.sValue = *res.oValue;
      ce.uTtl = res.uTtl == 0 ? common::kDefaultTtlSeconds : res.uTtl;
      ce.sContentRef = res.sContentRef;
      ce.source = res.source;
      ce.tpStoredAt = std::chrono::system_clock::now();
      _rcCache.put(sKey, sType, std::move(ce));
    }
  } catch (const std::exception& ex) {
    spLog->error("Failed to resolve {} {}: {}", sDomain, sType, ex.what());
    res = common::ResolveResult{};
    res.source = common::ResolutionSource::Error;
    res.oError = ex.what();
  }

  res.dLatencyMs = elapsedMs(tpStart);
  return res;
}

// ── Batch resolution ───────────────────────────────────────────────────────

common::BatchResolveResult ResolutionEngine::resolveBatch(const std::string& sDomain,
                                                          const std::vector<std::string>& vTypes,
                                                          const common::ResolveOptions& ro) {
  const auto tpStart = Clock::now();
  auto spLog = common::Logger::get();
  {
    std::lock_guard<std::mutex> lock(_mtxStats);
    ++_rstStats.uTotalQueries;
  }

  common::BatchResolveResult bres;
  try {
    if (vTypes.empty()) {
      throw common::ValidationError("empty_types", "Batch resolution needs at least one type");
    }
    const std::string sKey = domainKeyFor(sDomain);

    if (_opts.bUseCache && !ro.bSkipCache) {
      std::vector<common::CacheEntry> vEntries;
      vEntries.reserve(vTypes.size());
      for (const auto& sType : vTypes) {
        auto oEntry = _rcCache.get(sKey, sType);
        if (!oEntry) break;
        vEntries.push_back(std::move(*oEntry));
      }
      if (vEntries.size() == vTypes.size()) {
        noteCacheHit();
        for (const auto& ce : vEntries) {
          bres.vValues.emplace_back(ce.sValue);
          bres.vTtls.push_back(ce.uTtl);
        }
        bres.sContentRef = vEntries.front().sContentRef;
        bres.source = common::ResolutionSource::Cache;
        bres.dLatencyMs = elapsedMs(tpStart);
        return bres;
      }
    }

    const bool bVerify = ro.oVerify.value_or(_opts.bVerifyWithAuthoritative);

    if (ro.bForceAuthoritative) {
      bres = batchFromAuthoritative(readAuthoritative(sKey), vTypes);
    } else if (ro.bForceFast) {
      bres = batchFromFast(readFastBatch(sKey, vTypes), vTypes.size());
    } else if (_opts.bPreferFast) {
      bool bFastOk = false;
      try {
        bres = batchFromFast(readFastBatch(sKey, vTypes), vTypes.size());
        bFastOk = true;
      } catch (const common::ValidationError&) {
        // Malformed fast-tier answers are a contract violation, not an outage
        throw;
      } catch (const std::exception& ex) {
        spLog->warn("Fast tier batch failed for {}, falling back to authoritative: {}",
                    sDomain, ex.what());
        noteFallback();
        bres = batchFromAuthoritative(readAuthoritative(sKey), vTypes);
      }

      if (bFastOk && bVerify) {
        try {
          const auto ar = readAuthoritative(sKey);
          auto bresAuth = batchFromAuthoritative(ar, vTypes);
          if (bresAuth.source == common::ResolutionSource::Fallback) {
            spLog->warn("Cannot verify batch for {}: authoritative content unavailable",
                        sDomain);
          } else {
            bool bMismatch = !bres.sContentRef.empty() &&
                             bres.sContentRef != bresAuth.sContentRef;
            for (size_t i = 0; bres.sContentRef.empty() && i < vTypes.size(); ++i) {
              if (!holdsValue(ar, vTypes[i], bres.vValues[i])) {
                bMismatch = true;
                break;
              }
            }
            if (bMismatch) {
              noteMismatch();
              spLog->warn("Fast and authoritative batch disagree for {}, using authoritative",
                          sDomain);
              bres = std::move(bresAuth);
            }
          }
        } catch (const std::exception& ex) {
          spLog->warn("Batch verification read failed for {}, keeping fast result: {}",
                      sDomain, ex.what());
        }
      }
    } else {
      bres = batchFromAuthoritative(readAuthoritative(sKey), vTypes);
    }

    if (_opts.bUseCache) {
      const auto tpNow = std::chrono::system_clock::now();
      for (size_t i = 0; i < vTypes.size(); ++i) {
        if (!bres.vValues[i]) continue;
        common::CacheEntry ce;
        ce.sValue = *bres.vValues[i];
        ce.uTtl = bres.vTtls[i] == 0 ? common::kDefaultTtlSeconds : bres.vTtls[i];
        ce.sContentRef = bres.sContentRef;
        ce.source = bres.source;
        ce.tpStoredAt = tpNow;
        _rcCache.put(sKey, vTypes[i], std::move(ce));
      }
    }
  } catch (const std::exception& ex) {
    spLog->error("Failed to batch resolve {}: {}", sDomain, ex.what());
    bres = common::BatchResolveResult{};
    bres.vValues.assign(vTypes.size(), std::nullopt);
    bres.vTtls.assign(vTypes.size(), 0);
    bres.source = common::ResolutionSource::Error;
    bres.oError = ex.what();
  }

  bres.dLatencyMs = elapsedMs(tpStart);
  return bres;
}

// ── Tier calls ─────────────────────────────────────────────────────────────

template <typename Fn>
auto ResolutionEngine::runTier(const char* pTier, Fn fnCall) -> decltype(fnCall()) {
  if (_opts.iTierTimeoutMs <= 0) {
    return fnCall();
  }

  auto fut = _pPool->submit(std::move(fnCall));
  if (fut.wait_for(std::chrono::milliseconds(_opts.iTierTimeoutMs)) ==
      std::future_status::timeout) {
    // The worker finishes in the background; its result is discarded
    throw common::TierTimeoutError("tier_timeout", std::string(pTier) + " tier exceeded " +
                                                       std::to_string(_opts.iTierTimeoutMs) +
                                                       "ms");
  }
  return fut.get();
}

common::FastRecord ResolutionEngine::readFast(const std::string& sKey, const std::string& sType) {
  const auto tpStart = Clock::now();
  try {
    auto fr = runTier("fast", [&flLedger = _flLedger, sKey, sType] {
      return flLedger.getRecord(sKey, sType);
    });
    noteTierCall(true, elapsedMs(tpStart), false);
    return fr;
  } catch (const std::exception&) {
    noteTierCall(true, 0.0, true);
    throw;
  }
}

common::FastBatch ResolutionEngine::readFastBatch(const std::string& sKey,
                                                  const std::vector<std::string>& vTypes) {
  const auto tpStart = Clock::now();
  try {
    auto fb = runTier("fast", [&flLedger = _flLedger, sKey, vTypes] {
      return flLedger.getBatchRecords(sKey, vTypes);
    });
    noteTierCall(true, elapsedMs(tpStart), false);
    return fb;
  } catch (const std::exception&) {
    noteTierCall(true, 0.0, true);
    throw;
  }
}

ResolutionEngine::AuthoritativeRead ResolutionEngine::readAuthoritative(const std::string& sKey) {
  const auto tpStart = Clock::now();
  try {
    auto ar = runTier("authoritative",
                      [&alLedger = _alLedger, &crResolver = _crResolver, sKey,
                       iNow = nowSeconds()] {
                        return fetchAuthoritative(alLedger, crResolver, sKey, iNow);
                      });
    noteTierCall(false, elapsedMs(tpStart), false);
    return ar;
  } catch (const std::exception&) {
    noteTierCall(false, 0.0, true);
    throw;
  }
}

ResolutionEngine::AuthoritativeRead ResolutionEngine::fetchAuthoritative(
    providers::IAuthoritativeLedger& alLedger, ContentResolver& crResolver,
    const std::string& sKey, int64_t iNow) {
  AuthoritativeRead ar;
  ar.drs = alLedger.getDomainRecord(sKey);
  ar.bRegistered = !common::DomainHash::isZero(ar.drs.sOwner);
  if (!ar.bRegistered) {
    return ar;
  }
  if (iNow >= ar.drs.iExpiry) {
    ar.bExpired = true;
    return ar;
  }
  if (common::DomainHash::isZero(ar.drs.sContentRef)) {
    return ar;
  }

  try {
    ar.oRecords = crResolver.fetch(ar.drs.sContentRef);
  } catch (const std::exception& ex) {
    // Ledger reads succeeded; only the content is degraded
    common::Logger::get()->warn("Content {} for {} unavailable: {}", ar.drs.sContentRef, sKey,
                                ex.what());
    ar.sContentError = ex.what();
  }
  return ar;
}

// ── Projection ─────────────────────────────────────────────────────────────

bool ResolutionEngine::holdsValue(const AuthoritativeRead& ar, const std::string& sType,
                                  const std::optional<std::string>& oValue) {
  const auto* pValues = ar.oRecords ? ContentResolver::findType(*ar.oRecords, sType) : nullptr;
  if (pValues == nullptr || pValues->empty()) {
    return !oValue.has_value();
  }
  // The fast ledger keeps one value per type, the last one synced
  return oValue.has_value() &&
         std::find(pValues->begin(), pValues->end(), *oValue) != pValues->end();
}

common::ResolveResult ResolutionEngine::fromFast(const common::FastRecord& fr) const {
  common::ResolveResult res;
  res.source = common::ResolutionSource::Fast;
  res.sContentRef = fr.sContentRef;
  if (!fr.sValue.empty()) {
    res.oValue = fr.sValue;
    res.uTtl = fr.uTtl;
    res.iTimestamp = fr.iTimestamp;
  }
  return res;
}

common::ResolveResult ResolutionEngine::fromAuthoritative(const AuthoritativeRead& ar,
                                                          const std::string& sType) const {
  common::ResolveResult res;
  res.source = common::ResolutionSource::Authoritative;
  if (!ar.bRegistered) {
    return res;
  }

  res.sContentRef = ar.drs.sContentRef;
  res.sOwner = ar.drs.sOwner;
  res.iLastUpdated = ar.drs.iLastUpdated;
  res.iExpiry = ar.drs.iExpiry;
  if (ar.bExpired) {
    res.oError = "expired";
    return res;
  }
  if (!ar.sContentError.empty()) {
    res.source = common::ResolutionSource::Fallback;
    res.oError = "content unavailable: " + ar.sContentError;
    return res;
  }
  if (!ar.oRecords) {
    return res;
  }

  res.iTimestamp = ar.oRecords->iTimestamp;
  const auto* pValues = ContentResolver::findType(*ar.oRecords, sType);
  if (pValues && !pValues->empty()) {
    res.oValue = pValues->front();
    res.uTtl = ar.oRecords->uTtl == 0 ? common::kDefaultTtlSeconds : ar.oRecords->uTtl;
  }
  return res;
}

common::BatchResolveResult ResolutionEngine::batchFromFast(const common::FastBatch& fb,
                                                           size_t nTypes) const {
  if (fb.vValues.size() != nTypes || fb.vTtls.size() != nTypes) {
    throw common::ValidationError(
        "batch_length_mismatch",
        "Fast tier returned " + std::to_string(fb.vValues.size()) + " values and " +
            std::to_string(fb.vTtls.size()) + " ttls for " + std::to_string(nTypes) + " types");
  }

  common::BatchResolveResult bres;
  bres.source = common::ResolutionSource::Fast;
  bres.sContentRef = fb.sContentRef;
  for (size_t i = 0; i < nTypes; ++i) {
    if (fb.vValues[i].empty()) {
      bres.vValues.emplace_back(std::nullopt);
      bres.vTtls.push_back(0);
    } else {
      bres.vValues.emplace_back(fb.vValues[i]);
      bres.vTtls.push_back(fb.vTtls[i]);
    }
  }
  return bres;
}

common::BatchResolveResult ResolutionEngine::batchFromAuthoritative(
    const AuthoritativeRead& ar, const std::vector<std::string>& vTypes) const {
  common::BatchResolveResult bres;
  bres.source = common::ResolutionSource::Authoritative;
  bres.vValues.assign(vTypes.size(), std::nullopt);
  bres.vTtls.assign(vTypes.size(), 0);
  if (!ar.bRegistered) {
    return bres;
  }

  bres.sContentRef = ar.drs.sContentRef;
  if (ar.bExpired) {
    bres.oError = "expired";
    return bres;
  }
  if (!ar.sContentError.empty()) {
    bres.source = common::ResolutionSource::Fallback;
    bres.oError = "content unavailable: " + ar.sContentError;
    return bres;
  }
  if (!ar.oRecords) {
    return bres;
  }

  const uint32_t uTtl =
      ar.oRecords->uTtl == 0 ? common::kDefaultTtlSeconds : ar.oRecords->uTtl;
  for (size_t i = 0; i < vTypes.size(); ++i) {
    const auto* pValues = ContentResolver::findType(*ar.oRecords, vTypes[i]);
    if (pValues && !pValues->empty()) {
      bres.vValues[i] = pValues->front();
      bres.vTtls[i] = uTtl;
    }
  }
  return bres;
}

// ── Statistics ─────────────────────────────────────────────────────────────

void ResolutionEngine::noteCacheHit() {
  std::lock_guard<std::mutex> lock(_mtxStats);
  ++_rstStats.uCacheHits;
}

void ResolutionEngine::noteTierCall(bool bFast, double dLatencyMs, bool bError) {
  std::lock_guard<std::mutex> lock(_mtxStats);
  if (bFast) {
    ++_rstStats.uFastQueries;
    if (bError) {
      ++_rstStats.uFastErrors;
    } else {
      _rstStats.dFastLatencySumMs += dLatencyMs;
    }
  } else {
    ++_rstStats.uAuthQueries;
    if (bError) {
      ++_rstStats.uAuthErrors;
    } else {
      _rstStats.dAuthLatencySumMs += dLatencyMs;
    }
  }
}

void ResolutionEngine::noteMismatch() {
  std::lock_guard<std::mutex> lock(_mtxStats);
  ++_rstStats.uVerificationMismatches;
}

void ResolutionEngine::noteFallback() {
  std::lock_guard<std::mutex> lock(_mtxStats);
  ++_rstStats.uFallbacks;
}

common::ResolverStats ResolutionEngine::stats() const {
  common::ResolverStats rst;
  {
    std::lock_guard<std::mutex> lock(_mtxStats);
    rst = _rstStats;
  }
  return withDerivedMetrics(rst);
}

common::ResolverStats ResolutionEngine::withDerivedMetrics(common::ResolverStats rst) {
  rst.dFastAvgLatencyMs =
      rst.uFastQueries > 0 ? rst.dFastLatencySumMs / static_cast<double>(rst.uFastQueries) : 0.0;
  rst.dAuthAvgLatencyMs =
      rst.uAuthQueries > 0 ? rst.dAuthLatencySumMs / static_cast<double>(rst.uAuthQueries) : 0.0;
  rst.dCacheHitRate = rst.uTotalQueries > 0
                          ? static_cast<double>(rst.uCacheHits) /
                                static_cast<double>(rst.uTotalQueries) * 100.0
                          : 0.0;
  rst.dLatencyReduction =
      rst.dAuthAvgLatencyMs > 0.0 && rst.dFastAvgLatencyMs > 0.0
          ? (rst.dAuthAvgLatencyMs - rst.dFastAvgLatencyMs) / rst.dAuthAvgLatencyMs * 100.0
          : 0.0;
  return rst;
}

void ResolutionEngine::clearCache() {
  _rcCache.clear();
  common::Logger::get()->info("Resolution cache cleared");
}

}  // namespace ddns::core
