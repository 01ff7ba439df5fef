#pragma once

#include <crow.h>

namespace ddns::core {
class SyncEngine;
}

namespace ddns::dal {
class SyncStateRepository;
}

namespace ddns::api::routes {

/// Handlers for /api/v1/bridge
/// Class abbreviation: br
class BridgeRoutes {
 public:
  /// pRepo may be nullptr when persistence is disabled.
  BridgeRoutes(core::SyncEngine& seEngine, dal::SyncStateRepository* pRepo);
  ~BridgeRoutes();

  void registerRoutes(crow::SimpleApp& app);

 private:
  core::SyncEngine& _seEngine;
  dal::SyncStateRepository* _pRepo;
};

}  // namespace ddns::api::routes
