#include "api/routes/BridgeRoutes.hpp"

#include "api/ResponseJson.hpp"
#include "common/Errors.hpp"
#include "core/SyncEngine.hpp"
#include "dal/SyncStateRepository.hpp"

#include <nlohmann/json.hpp>

namespace ddns::api::routes {

BridgeRoutes::BridgeRoutes(core::SyncEngine& seEngine, dal::SyncStateRepository* pRepo)
    : _seEngine(seEngine), _pRepo(pRepo) {}

BridgeRoutes::~BridgeRoutes() = default;

void BridgeRoutes::registerRoutes(crow::SimpleApp& app) {
  // POST /api/v1/bridge/stop
  CROW_ROUTE(app, "/api/v1/bridge/stop").methods("POST"_method)([this]() -> crow::response {
    nlohmann::json jResp = {{"stopped", _seEngine.stop()}};
    crow::response resp(200, jResp.dump(2));
    resp.set_header("Content-Type", "application/json");
    return resp;
  });

  // GET /api/v1/bridge/dead-letters?limit=
  CROW_ROUTE(app, "/api/v1/bridge/dead-letters").methods("GET"_method)(
      [this](const crow::request& req) -> crow::response {
        try {
          if (_pRepo == nullptr) {
            throw common::NotFoundError("persistence_disabled",
                                        "Dead letters are only kept when DDNS_DB_URL is set");
          }
          int iLimit = 100;
          if (const char* pLimit = req.url_params.get("limit")) {
            try {
              iLimit = std::stoi(pLimit);
            } catch (const std::exception&) {
              throw common::ValidationError("invalid_limit", "limit must be an integer");
            }
            if (iLimit < 1 || iLimit > 1000) {
              throw common::ValidationError("invalid_limit", "limit must be in [1, 1000]");
            }
          }

          nlohmann::json jRows = nlohmann::json::array();
          for (const auto& dlr : _pRepo->listAbandoned(iLimit)) {
            jRows.push_back(toJson(dlr));
          }
          crow::response resp(200, jRows.dump(2));
          resp.set_header("Content-Type", "application/json");
          return resp;
        } catch (const common::AppError& e) {
          nlohmann::json jErr = {{"error", e._sErrorCode}, {"message", e.what()}};
          return crow::response(e._iHttpStatus, jErr.dump(2));
        } catch (const std::exception& e) {
          nlohmann::json jErr = {{"error", "internal_error"}, {"message", e.what()}};
          return crow::response(500, jErr.dump(2));
        }
      });
}

}  // namespace ddns::api::routes
