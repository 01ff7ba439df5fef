#pragma once

#include <memory>

#include <crow.h>

#include "api/routes/BridgeRoutes.hpp"
#include "api/routes/HealthRoutes.hpp"
#include "api/routes/ResolveRoutes.hpp"
#include "api/routes/StatsRoutes.hpp"

namespace ddns::api {

/// Owns the Crow application instance; registers all routes at startup.
/// Class abbreviation: api
class ApiServer {
 public:
  /// pRepo may be nullptr when persistence is disabled.
  ApiServer(core::SyncEngine& seEngine, core::ResolutionEngine& reEngine,
            dal::SyncStateRepository* pRepo);
  ~ApiServer();

  void registerRoutes();

  /// Blocks until stop() is called or the process is signalled.
  void start(int iPort, int iThreads);
  void stop();

 private:
  crow::SimpleApp _app;
  routes::HealthRoutes _hrHealth;
  routes::StatsRoutes _strStats;
  routes::ResolveRoutes _rrResolve;
  routes::BridgeRoutes _brBridge;
};

}  // namespace ddns::api
