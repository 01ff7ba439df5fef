#pragma once

#include <crow.h>

namespace ddns::core {
class SyncEngine;
}

namespace ddns::api::routes {

/// Handler for /api/v1/health
/// Class abbreviation: hr
class HealthRoutes {
 public:
  explicit HealthRoutes(const core::SyncEngine& seEngine);
  ~HealthRoutes();

  void registerRoutes(crow::SimpleApp& app);

 private:
  const core::SyncEngine& _seEngine;
};

}  // namespace ddns::api::routes
