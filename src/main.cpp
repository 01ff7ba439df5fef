#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "api/ApiServer.hpp"
#include "common/Config.hpp"
#include "common/Logger.hpp"
#include "core/ContentResolver.hpp"
#include "core/ResolutionCache.hpp"
#include "core/ResolutionEngine.hpp"
#include "core/SyncEngine.hpp"
#include "core/ThreadPool.hpp"
#include "core/WorkQueue.hpp"
#include "dal/ConnectionPool.hpp"
#include "dal/SyncStateRepository.hpp"
#include "providers/ProviderFactory.hpp"

#include <curl/curl.h>
#include <openssl/crypto.h>

namespace {

/// Calls curl_global_init once for the process lifetime.
struct CurlGlobal {
  CurlGlobal() {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw std::runtime_error("curl_global_init failed");
    }
  }
  ~CurlGlobal() { curl_global_cleanup(); }
};

}  // namespace

int main() {
  try {
    // ── Step 1: Load and validate configuration ──────────────────────────
    auto cfgApp = ddns::common::Config::load();

    ddns::common::Logger::init(cfgApp.sLogLevel, cfgApp.oLogFile);
    auto spLog = ddns::common::Logger::get();
    spLog->info("Step 1: Configuration loaded (ledger mode={})", cfgApp.sLedgerMode);

    // ── Step 2: Ledger and content adapters ──────────────────────────────
    CurlGlobal cgCurl;
    auto lsLedgers = ddns::providers::ProviderFactory::create(cfgApp);

    // Zero the RPC token after handoff to the clients
    OPENSSL_cleanse(cfgApp.sRpcAuthToken.data(), cfgApp.sRpcAuthToken.size());
    cfgApp.sRpcAuthToken.clear();
    spLog->info("Step 2: Ledger adapters ready");

    // ── Step 3: Optional sync state persistence ──────────────────────────
    std::unique_ptr<ddns::dal::ConnectionPool> upPool;
    std::unique_ptr<ddns::dal::SyncStateRepository> upRepo;
    if (cfgApp.oDbUrl) {
      upPool = std::make_unique<ddns::dal::ConnectionPool>(*cfgApp.oDbUrl, cfgApp.iDbPoolSize);
      upRepo = std::make_unique<ddns::dal::SyncStateRepository>(*upPool);
      upRepo->ensureSchema();
      spLog->info("Step 3: Sync state persistence enabled (pool size={})", cfgApp.iDbPoolSize);
    } else {
      spLog->warn("Step 3: DDNS_DB_URL not set, sync state will not survive restarts");
    }

    // ── Step 4: Resolution engine ────────────────────────────────────────
    ddns::core::ContentResolver crResolver(*lsLedgers.upContentStore, *lsLedgers.upDecoder);
    ddns::core::ResolutionCache rcCache;
    ddns::core::ThreadPool tpPool(cfgApp.iThreadPoolSize);

    ddns::core::ResolutionEngine::Options reOpts;
    reOpts.bUseCache = cfgApp.bUseCache;
    reOpts.bPreferFast = cfgApp.bPreferFast;
    reOpts.bVerifyWithAuthoritative = cfgApp.bVerifyWithAuthoritative;
    reOpts.iTierTimeoutMs = cfgApp.iTierTimeoutMs;
    ddns::core::ResolutionEngine reEngine(*lsLedgers.upAuthoritative, *lsLedgers.upFast,
                                          crResolver, rcCache, reOpts, &tpPool);
    spLog->info("Step 4: Resolution engine ready (prefer fast={}, verify={}, tier timeout={}ms, "
                "pool={})",
                reOpts.bPreferFast, reOpts.bVerifyWithAuthoritative, reOpts.iTierTimeoutMs,
                tpPool.size());

    // ── Step 5: Sync engine ──────────────────────────────────────────────
    ddns::core::WorkQueue wqQueue;
    ddns::core::SyncEngine::Options seOpts;
    seOpts.durPollInterval = std::chrono::milliseconds(cfgApp.iPollIntervalMs);
    seOpts.durApplyInterval = std::chrono::milliseconds(cfgApp.iApplyIntervalMs);
    seOpts.iApplyBatchSize = cfgApp.iApplyBatchSize;
    seOpts.iMaxRetries = cfgApp.iMaxRetries;
    seOpts.iRetryBackoffMs = cfgApp.iRetryBackoffMs;
    seOpts.iConfirmations = cfgApp.iConfirmations;
    seOpts.uSafetyWindow = static_cast<uint64_t>(cfgApp.iSafetyWindow);
    seOpts.uFallbackTtlSeconds = static_cast<uint32_t>(cfgApp.iFallbackTtlSeconds);
    ddns::core::SyncEngine seEngine(*lsLedgers.upAuthoritative, *lsLedgers.upFast, crResolver,
                                    wqQueue, seOpts, upRepo.get());
    if (!seEngine.start()) {
      throw std::runtime_error("sync engine failed to start");
    }
    spLog->info("Step 5: Sync engine started");

    // ── Step 6: HTTP API (blocks until SIGINT/SIGTERM) ───────────────────
    ddns::api::ApiServer apiServer(seEngine, reEngine, upRepo.get());
    apiServer.registerRoutes();
    spLog->info("Step 6: ddns-bridge ready");
    apiServer.start(cfgApp.iHttpPort, cfgApp.iHttpThreads);

    // Graceful shutdown
    seEngine.stop();
    tpPool.shutdown();
    spLog->info("ddns-bridge stopped");

    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    std::cerr << "[fatal] startup failed: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
}
