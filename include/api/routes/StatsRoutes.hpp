#pragma once

#include <crow.h>

namespace ddns::core {
class ResolutionEngine;
class SyncEngine;
}  // namespace ddns::core

namespace ddns::api::routes {

/// Handler for /api/v1/stats
/// Class abbreviation: str
class StatsRoutes {
 public:
  StatsRoutes(const core::SyncEngine& seEngine, const core::ResolutionEngine& reEngine);
  ~StatsRoutes();

  void registerRoutes(crow::SimpleApp& app);

 private:
  const core::SyncEngine& _seEngine;
  const core::ResolutionEngine& _reEngine;
};

}  // namespace ddns::api::routes
