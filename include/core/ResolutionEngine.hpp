#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "common/Types.hpp"

namespace ddns::providers {
class IAuthoritativeLedger;
class IFastLedger;
}  // namespace ddns::providers

namespace ddns::core {

class ContentResolver;
class ResolutionCache;
class ThreadPool;

/// Answers domain queries from the cache, the fast ledger or the
/// authoritative ledger, optionally cross-checking fast answers.
///
/// Tier order per query: cache, then fast (falling back to authoritative on
/// error) unless a tier is forced or the fast tier is disabled by policy.
/// resolve() and resolveBatch() never throw; failures come back as
/// source=error with the reason in oError.
/// Class abbreviation: re
class ResolutionEngine {
 public:
  struct Options {
    bool bUseCache = true;
    bool bPreferFast = true;
    bool bVerifyWithAuthoritative = false;
    int iTierTimeoutMs = 0;  // 0 = tier calls run inline without a deadline
  };

  /// pPool is required only when iTierTimeoutMs > 0.
  ResolutionEngine(providers::IAuthoritativeLedger& alLedger, providers::IFastLedger& flLedger,
                   ContentResolver& crResolver, ResolutionCache& rcCache, Options opts,
                   ThreadPool* pPool = nullptr);
  ~ResolutionEngine();

  ResolutionEngine(const ResolutionEngine&) = delete;
  ResolutionEngine& operator=(const ResolutionEngine&) = delete;

  /// sDomain is a domain name, or an already-derived "0x" key.
  common::ResolveResult resolve(const std::string& sDomain, const std::string& sType,
                                const common::ResolveOptions& ro = {});

  /// One round trip for several types of one domain.
  common::BatchResolveResult resolveBatch(const std::string& sDomain,
                                          const std::vector<std::string>& vTypes,
                                          const common::ResolveOptions& ro = {});

  common::ResolverStats stats() const;
  void clearCache();

  /// Fill the averages, hit rate and latency reduction from the raw counters.
  static common::ResolverStats withDerivedMetrics(common::ResolverStats rst);

  /// Ledger key for a domain name; "0x"-prefixed 32-byte hex passes through.
  static std::string domainKeyFor(const std::string& sDomain);

 private:
  /// Everything one authoritative read learned about a domain.
  struct AuthoritativeRead {
    common::DomainRecordSet drs;
    bool bRegistered = false;
    bool bExpired = false;
    std::optional<common::RecordSet> oRecords;  // unset when no content or degraded
    std::string sContentError;                  // set when the content fetch degraded
  };

  common::FastRecord readFast(const std::string& sKey, const std::string& sType);
  common::FastBatch readFastBatch(const std::string& sKey,
                                  const std::vector<std::string>& vTypes);
  AuthoritativeRead readAuthoritative(const std::string& sKey);

  static AuthoritativeRead fetchAuthoritative(providers::IAuthoritativeLedger& alLedger,
                                              ContentResolver& crResolver,
                                              const std::string& sKey, int64_t iNow);

  /// True if oValue is one of the authoritative values for sType, or both
  /// sides have no value. Used when the fast tier reports no content reference.
  static bool holdsValue(const AuthoritativeRead& ar, const std::string& sType,
                         const std::optional<std::string>& oValue);

  common::ResolveResult fromFast(const common::FastRecord& fr) const;
  common::ResolveResult fromAuthoritative(const AuthoritativeRead& ar,
                                          const std::string& sType) const;
  common::BatchResolveResult batchFromFast(const common::FastBatch& fb,
                                           size_t nTypes) const;
  common::BatchResolveResult batchFromAuthoritative(const AuthoritativeRead& ar,
                                                    const std::vector<std::string>& vTypes) const;

  template <typename Fn>
  auto runTier(const char* pTier, Fn fnCall) -> decltype(fnCall());

  void noteCacheHit();
  void noteTierCall(bool bFast, double dLatencyMs, bool bError);
  void noteMismatch();
  void noteFallback();

  providers::IAuthoritativeLedger& _alLedger;
  providers::IFastLedger& _flLedger;
  ContentResolver& _crResolver;
  ResolutionCache& _rcCache;
  Options _opts;
  ThreadPool* _pPool;

  mutable std::mutex _mtxStats;
  common::ResolverStats _rstStats;
};

}  // namespace ddns::core
