#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace ddns::common {

/// Environment variable loader for the bridge and resolver.
/// Loads all DDNS_* env vars into a typed struct with validation.
/// Class abbreviation: cfg
struct Config {
  // ── Ledger adapters ───────────────────────────────────────────────────
  std::string sLedgerMode = "rpc";  // "rpc" | "memory"
  std::string sL1RpcUrl;
  std::string sL2RpcUrl;
  std::string sRpcAuthToken;  // raw token (zeroed after handoff to JsonRpcClient)
  int iRpcTimeoutMs = 10000;

  // ── Content store ─────────────────────────────────────────────────────
  std::string sContentGateway = "https://ipfs.io/ipfs/";

  // ── Sync engine ───────────────────────────────────────────────────────
  int iPollIntervalMs = 30000;
  int iApplyIntervalMs = 1000;
  int iApplyBatchSize = 1;
  int iMaxRetries = 5;
  int iRetryBackoffMs = 1000;
  int iConfirmations = 3;
  int64_t iSafetyWindow = 10000;
  int iFallbackTtlSeconds = 300;

  // ── Resolution engine ─────────────────────────────────────────────────
  bool bUseCache = true;
  bool bPreferFast = true;
  bool bVerifyWithAuthoritative = false;
  int iTierTimeoutMs = 0;  // 0 = no per-tier timeout

  // ── Thread pool ───────────────────────────────────────────────────────
  int iThreadPoolSize = 0;  // 0 = std::thread::hardware_concurrency()

  // ── Database (optional) ───────────────────────────────────────────────
  std::optional<std::string> oDbUrl;
  int iDbPoolSize = 4;

  // ── HTTP ──────────────────────────────────────────────────────────────
  int iHttpPort = 8080;
  int iHttpThreads = 4;

  // ── Logging ───────────────────────────────────────────────────────────
  std::string sLogLevel = "info";
  std::optional<std::string> oLogFile;

  /// Load and validate all config from environment variables.
  /// Implements _FILE fallback for DDNS_RPC_AUTH_TOKEN.
  /// Throws on missing required vars or invalid constraints.
  static Config load();

 private:
  /// Read an env var with optional _FILE fallback for secrets.
  /// If varName is unset, tries varName + "_FILE" and reads file contents.
  /// Trims trailing whitespace/newlines from file contents.
  static std::string loadSecret(const char* pVarName);

  /// Read an env var, return empty string if unset.
  static std::string getEnv(const char* pVarName);

  /// Read an env var as int with a default value.
  static int getEnvInt(const char* pVarName, int iDefault);

  /// Read an env var as int64 with a default value.
  static int64_t getEnvInt64(const char* pVarName, int64_t iDefault);

  /// Read an env var as bool (true/false/1/0/yes/no), default when unset.
  static bool getEnvBool(const char* pVarName, bool bDefault);
};

}  // namespace ddns::common
