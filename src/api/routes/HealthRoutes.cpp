#include "api/routes/HealthRoutes.hpp"

#include "core/SyncEngine.hpp"

#include <nlohmann/json.hpp>

namespace ddns::api::routes {

HealthRoutes::HealthRoutes(const core::SyncEngine& seEngine) : _seEngine(seEngine) {}
HealthRoutes::~HealthRoutes() = default;

void HealthRoutes::registerRoutes(crow::SimpleApp& app) {
  // GET /api/v1/health
  CROW_ROUTE(app, "/api/v1/health").methods("GET"_method)([this]() -> crow::response {
    nlohmann::json jResp = {{"status", "ok"}, {"bridge_running", _seEngine.isRunning()}};
    crow::response resp(200, jResp.dump(2));
    resp.set_header("Content-Type", "application/json");
    return resp;
  });
}

}  // namespace ddns::api::routes
