#include "api/routes/StatsRoutes.hpp"

#include "api/ResponseJson.hpp"
#include "core/ResolutionEngine.hpp"
#include "core/SyncEngine.hpp"

#include <nlohmann/json.hpp>

namespace ddns::api::routes {

StatsRoutes::StatsRoutes(const core::SyncEngine& seEngine, const core::ResolutionEngine& reEngine)
    : _seEngine(seEngine), _reEngine(reEngine) {}

StatsRoutes::~StatsRoutes() = default;

void StatsRoutes::registerRoutes(crow::SimpleApp& app) {
  // GET /api/v1/stats
  CROW_ROUTE(app, "/api/v1/stats").methods("GET"_method)([this]() -> crow::response {
    nlohmann::json jResp = {
        {"bridge", toJson(_seEngine.stats())},
        {"resolver", toJson(_reEngine.stats())},
    };
    crow::response resp(200, jResp.dump(2));
    resp.set_header("Content-Type", "application/json");
    return resp;
  });
}

}  // namespace ddns::api::routes
