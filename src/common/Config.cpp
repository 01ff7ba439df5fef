#include "common/Config.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace ddns::common {

std::string Config::getEnv(const char* pVarName) {
  const char* pValue = std::getenv(pVarName);
  return pValue ? std::string(pValue) : std::string{};
}

int Config::getEnvInt(const char* pVarName, int iDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return iDefault;
  }
  try {
    return std::stoi(sValue);
  } catch (const std::exception&) {
    throw std::runtime_error(
        std::string("Invalid integer value for ") + pVarName + ": " + sValue);
  }
}

int64_t Config::getEnvInt64(const char* pVarName, int64_t iDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return iDefault;
  }
  try {
    return std::stoll(sValue);
  } catch (const std::exception&) {
    throw std::runtime_error(
        std::string("Invalid integer value for ") + pVarName + ": " + sValue);
  }
}

bool Config::getEnvBool(const char* pVarName, bool bDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return bDefault;
  }
  return sValue == "true" || sValue == "1" || sValue == "yes";
}

std::string Config::loadSecret(const char* pVarName) {
  std::string sValue = getEnv(pVarName);
  if (!sValue.empty()) {
    return sValue;
  }

  const std::string sFileVar = std::string(pVarName) + "_FILE";
  const std::string sFilePath = getEnv(sFileVar.c_str());
  if (sFilePath.empty()) {
    throw std::runtime_error(
        std::string("Required secret not set: neither ") + pVarName + " nor " + sFileVar +
        " is defined");
  }

  std::ifstream ifs(sFilePath);
  if (!ifs.is_open()) {
    throw std::runtime_error(
        std::string("Cannot open secret file specified by ") + sFileVar + ": " + sFilePath);
  }

  std::ostringstream oss;
  oss << ifs.rdbuf();
  sValue = oss.str();

  while (!sValue.empty() &&
         (sValue.back() == '\n' || sValue.back() == '\r' || sValue.back() == ' ')) {
    sValue.pop_back();
  }

  if (sValue.empty()) {
    throw std::runtime_error(
        std::string("Secret file is empty: ") + sFilePath + " (from " + sFileVar + ")");
  }

  return sValue;
}

Config Config::load() {
  Config cfg;

  // ── Ledger mode and endpoints ──────────────────────────────────────────
  const std::string sMode = getEnv("DDNS_LEDGER_MODE");
  if (!sMode.empty()) {
    cfg.sLedgerMode = sMode;
  }
  if (cfg.sLedgerMode != "rpc" && cfg.sLedgerMode != "memory") {
    throw std::runtime_error("DDNS_LEDGER_MODE must be 'rpc' or 'memory' (got '" +
                             cfg.sLedgerMode + "')");
  }

  if (cfg.sLedgerMode == "rpc") {
    cfg.sL1RpcUrl = getEnv("DDNS_L1_RPC_URL");
    if (cfg.sL1RpcUrl.empty()) {
      throw std::runtime_error("Required environment variable DDNS_L1_RPC_URL is not set");
    }
    cfg.sL2RpcUrl = getEnv("DDNS_L2_RPC_URL");
    if (cfg.sL2RpcUrl.empty()) {
      throw std::runtime_error("Required environment variable DDNS_L2_RPC_URL is not set");
    }
    cfg.sRpcAuthToken = loadSecret("DDNS_RPC_AUTH_TOKEN");
  }
  cfg.iRpcTimeoutMs = getEnvInt("DDNS_RPC_TIMEOUT_MS", 10000);

  const std::string sGateway = getEnv("DDNS_CONTENT_GATEWAY");
  if (!sGateway.empty()) {
    cfg.sContentGateway = sGateway;
  }

  // ── Sync engine ────────────────────────────────────────────────────────
  cfg.iPollIntervalMs = getEnvInt("DDNS_POLL_INTERVAL_MS", 30000);
  cfg.iApplyIntervalMs = getEnvInt("DDNS_APPLY_INTERVAL_MS", 1000);
  cfg.iApplyBatchSize = getEnvInt("DDNS_APPLY_BATCH_SIZE", 1);
  cfg.iMaxRetries = getEnvInt("DDNS_MAX_RETRIES", 5);
  cfg.iRetryBackoffMs = getEnvInt("DDNS_RETRY_BACKOFF_MS", 1000);
  cfg.iConfirmations = getEnvInt("DDNS_CONFIRMATIONS", 3);
  cfg.iSafetyWindow = getEnvInt64("DDNS_SAFETY_WINDOW", 10000);
  cfg.iFallbackTtlSeconds = getEnvInt("DDNS_FALLBACK_TTL_SECONDS", 300);

  // ── Resolution engine ──────────────────────────────────────────────────
  cfg.bUseCache = getEnvBool("DDNS_USE_CACHE", true);
  cfg.bPreferFast = getEnvBool("DDNS_PREFER_FAST", true);
  cfg.bVerifyWithAuthoritative = getEnvBool("DDNS_VERIFY_WITH_AUTHORITATIVE", false);
  cfg.iTierTimeoutMs = getEnvInt("DDNS_TIER_TIMEOUT_MS", 0);
  cfg.iThreadPoolSize = getEnvInt("DDNS_THREAD_POOL_SIZE", 0);

  // ── Database ───────────────────────────────────────────────────────────
  const std::string sDbUrl = getEnv("DDNS_DB_URL");
  if (!sDbUrl.empty()) {
    cfg.oDbUrl = sDbUrl;
  }
  cfg.iDbPoolSize = getEnvInt("DDNS_DB_POOL_SIZE", 4);

  // ── HTTP ───────────────────────────────────────────────────────────────
  cfg.iHttpPort = getEnvInt("DDNS_HTTP_PORT", 8080);
  cfg.iHttpThreads = getEnvInt("DDNS_HTTP_THREADS", 4);

  // ── Logging ────────────────────────────────────────────────────────────
  const std::string sLogLevel = getEnv("DDNS_LOG_LEVEL");
  if (!sLogLevel.empty()) {
    cfg.sLogLevel = sLogLevel;
  }
  const std::string sLogFile = getEnv("DDNS_LOG_FILE");
  if (!sLogFile.empty()) {
    cfg.oLogFile = sLogFile;
  }

  // ── Validation ─────────────────────────────────────────────────────────

  if (cfg.iPollIntervalMs < 1 || cfg.iApplyIntervalMs < 1) {
    throw std::runtime_error("DDNS_POLL_INTERVAL_MS and DDNS_APPLY_INTERVAL_MS must be >= 1");
  }

  if (cfg.iApplyBatchSize < 1) {
    throw std::runtime_error("DDNS_APPLY_BATCH_SIZE must be >= 1 (got " +
                             std::to_string(cfg.iApplyBatchSize) + ")");
  }

  if (cfg.iMaxRetries < 0 || cfg.iRetryBackoffMs < 0 || cfg.iConfirmations < 0 ||
      cfg.iSafetyWindow < 0 || cfg.iTierTimeoutMs < 0) {
    throw std::runtime_error(
        "DDNS_MAX_RETRIES, DDNS_RETRY_BACKOFF_MS, DDNS_CONFIRMATIONS, DDNS_SAFETY_WINDOW "
        "and DDNS_TIER_TIMEOUT_MS must not be negative");
  }

  if (cfg.iFallbackTtlSeconds < 1) {
    throw std::runtime_error("DDNS_FALLBACK_TTL_SECONDS must be >= 1 (got " +
                             std::to_string(cfg.iFallbackTtlSeconds) + ")");
  }

  if (cfg.iDbPoolSize < 1) {
    throw std::runtime_error("DDNS_DB_POOL_SIZE must be >= 1");
  }

  return cfg;
}

}  // namespace ddns::common
