#include "providers/ProviderFactory.hpp"

#include <stdexcept>

#include "common/Config.hpp"
#include "common/Logger.hpp"
#include "providers/ContentHashDecoder.hpp"
#include "providers/HttpContentStore.hpp"
#include "providers/InMemoryAuthoritativeLedger.hpp"
#include "providers/InMemoryContentStore.hpp"
#include "providers/InMemoryFastLedger.hpp"
#include "providers/RpcAuthoritativeLedger.hpp"
#include "providers/RpcFastLedger.hpp"

namespace ddns::providers {

LedgerSet ProviderFactory::create(const common::Config& cfgApp) {
  auto spLog = common::Logger::get();
  LedgerSet ls;
  ls.upDecoder = std::make_unique<ContentHashDecoder>();

  if (cfgApp.sLedgerMode == "rpc") {
    ls.upL1Client = std::make_unique<JsonRpcClient>(cfgApp.sL1RpcUrl, cfgApp.sRpcAuthToken,
                                                    cfgApp.iRpcTimeoutMs);
    ls.upL2Client = std::make_unique<JsonRpcClient>(cfgApp.sL2RpcUrl, cfgApp.sRpcAuthToken,
                                                    cfgApp.iRpcTimeoutMs);
    ls.upAuthoritative = std::make_unique<RpcAuthoritativeLedger>(*ls.upL1Client);
    ls.upFast = std::make_unique<RpcFastLedger>(*ls.upL2Client);
    ls.upContentStore =
        std::make_unique<HttpContentStore>(cfgApp.sContentGateway, cfgApp.iRpcTimeoutMs);
  } else if (cfgApp.sLedgerMode == "memory") {
    ls.upAuthoritative = std::make_unique<InMemoryAuthoritativeLedger>();
    ls.upFast = std::make_unique<InMemoryFastLedger>();
    ls.upContentStore = std::make_unique<InMemoryContentStore>();
  } else {
    throw std::runtime_error("Unsupported ledger mode: " + cfgApp.sLedgerMode);
  }

  spLog->info("Ledger adapters: authoritative={} fast={} content={}",
              ls.upAuthoritative->name(), ls.upFast->name(), ls.upContentStore->name());
  return ls;
}

}  // namespace ddns::providers
