#pragma once

#include <memory>
#include <string>

#include "providers/IAuthoritativeLedger.hpp"
#include "providers/IContentRefDecoder.hpp"
#include "providers/IContentStore.hpp"
#include "providers/IFastLedger.hpp"
#include "providers/JsonRpcClient.hpp"

namespace ddns::common {
struct Config;
}

namespace ddns::providers {

/// Adapters the bridge and resolver run against. RPC clients are declared
/// first so they outlive the ledgers that hold references to them.
/// Class abbreviation: ls
struct LedgerSet {
  std::unique_ptr<JsonRpcClient> upL1Client;
  std::unique_ptr<JsonRpcClient> upL2Client;
  std::unique_ptr<IAuthoritativeLedger> upAuthoritative;
  std::unique_ptr<IFastLedger> upFast;
  std::unique_ptr<IContentStore> upContentStore;
  std::unique_ptr<IContentRefDecoder> upDecoder;
};

/// Creates the adapter set for a ledger mode ("rpc" or "memory").
class ProviderFactory {
 public:
  /// Throws std::runtime_error for an unknown mode.
  static LedgerSet create(const common::Config& cfgApp);
};

}  // namespace ddns::providers
