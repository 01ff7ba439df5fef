#include "api/ApiServer.hpp"

#include "common/Logger.hpp"

namespace ddns::api {

ApiServer::ApiServer(core::SyncEngine& seEngine, core::ResolutionEngine& reEngine,
                     dal::SyncStateRepository* pRepo)
    : _hrHealth(seEngine),
      _strStats(seEngine, reEngine),
      _rrResolve(reEngine),
      _brBridge(seEngine, pRepo) {}

ApiServer::~ApiServer() = default;

void ApiServer::registerRoutes() {
  _hrHealth.registerRoutes(_app);
  _strStats.registerRoutes(_app);
  _rrResolve.registerRoutes(_app);
  _brBridge.registerRoutes(_app);
}

void ApiServer::start(int iPort, int iThreads) {
  common::Logger::get()->info("HTTP API listening on port {} ({} threads)", iPort, iThreads);
  _app.loglevel(crow::LogLevel::Warning);
  _app.port(static_cast<uint16_t>(iPort)).concurrency(static_cast<uint16_t>(iThreads)).run();
}

void ApiServer::stop() { _app.stop(); }

}  // namespace ddns::api
