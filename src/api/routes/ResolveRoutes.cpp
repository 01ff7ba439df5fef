#include "api/routes/ResolveRoutes.hpp"

#include "api/ResponseJson.hpp"
#include "common/Errors.hpp"
#include "core/ResolutionEngine.hpp"

#include <nlohmann/json.hpp>

namespace ddns::api::routes {

namespace {

bool isTruthy(const char* pValue) {
  if (pValue == nullptr) return false;
  const std::string sValue(pValue);
  return sValue == "1" || sValue == "true" || sValue == "yes";
}

void applyForce(const std::string& sForce, common::ResolveOptions& ro) {
  if (sForce.empty()) return;
  if (sForce == "fast") {
    ro.bForceFast = true;
  } else if (sForce == "authoritative") {
    ro.bForceAuthoritative = true;
  } else {
    throw common::ValidationError("invalid_force",
                                  "force must be 'fast' or 'authoritative', got '" + sForce + "'");
  }
}

}  // anonymous namespace

ResolveRoutes::ResolveRoutes(core::ResolutionEngine& reEngine) : _reEngine(reEngine) {}

ResolveRoutes::~ResolveRoutes() = default;

void ResolveRoutes::registerRoutes(crow::SimpleApp& app) {
  // GET /api/v1/resolve/<domain>/<type>?force=&verify=&skip_cache=
  CROW_ROUTE(app, "/api/v1/resolve/<string>/<string>").methods("GET"_method)(
      [this](const crow::request& req, const std::string& sDomain,
             const std::string& sType) -> crow::response {
        try {
          common::ResolveOptions ro;
          const char* pForce = req.url_params.get("force");
          applyForce(pForce ? std::string(pForce) : std::string{}, ro);
          if (req.url_params.get("verify") != nullptr) {
            ro.oVerify = isTruthy(req.url_params.get("verify"));
          }
          ro.bSkipCache = isTruthy(req.url_params.get("skip_cache"));

          auto res = _reEngine.resolve(sDomain, sType, ro);
          const int iStatus = res.source == common::ResolutionSource::Error ? 502 : 200;
          crow::response resp(iStatus, toJson(res).dump(2));
          resp.set_header("Content-Type", "application/json");
          return resp;
        } catch (const common::AppError& e) {
          nlohmann::json jErr = {{"error", e._sErrorCode}, {"message", e.what()}};
          return crow::response(e._iHttpStatus, jErr.dump(2));
        }
      });

  // POST /api/v1/resolve/batch
  CROW_ROUTE(app, "/api/v1/resolve/batch").methods("POST"_method)(
      [this](const crow::request& req) -> crow::response {
        try {
          auto jBody = nlohmann::json::parse(req.body);
          const std::string sDomain = jBody.value("domain", "");
          if (sDomain.empty() || !jBody.contains("types") || !jBody["types"].is_array() ||
              jBody["types"].empty()) {
            nlohmann::json jErr = {{"error", "validation_error"},
                                   {"message", "domain and a non-empty types array are required"}};
            return crow::response(400, jErr.dump(2));
          }
          const auto vTypes = jBody["types"].get<std::vector<std::string>>();

          common::ResolveOptions ro;
          applyForce(jBody.value("force", ""), ro);
          if (jBody.contains("verify") && jBody["verify"].is_boolean()) {
            ro.oVerify = jBody["verify"].get<bool>();
          }
          ro.bSkipCache = jBody.value("skip_cache", false);

          auto bres = _reEngine.resolveBatch(sDomain, vTypes, ro);
          const int iStatus = bres.source == common::ResolutionSource::Error ? 502 : 200;
          crow::response resp(iStatus, toJson(bres).dump(2));
          resp.set_header("Content-Type", "application/json");
          return resp;
        } catch (const common::AppError& e) {
          nlohmann::json jErr = {{"error", e._sErrorCode}, {"message", e.what()}};
          return crow::response(e._iHttpStatus, jErr.dump(2));
        } catch (const nlohmann::json::exception&) {
          nlohmann::json jErr = {{"error", "invalid_json"}, {"message", "Invalid JSON body"}};
          return crow::response(400, jErr.dump(2));
        }
      });

  // DELETE /api/v1/cache
  CROW_ROUTE(app, "/api/v1/cache").methods("DELETE"_method)([this]() -> crow::response {
    _reEngine.clearCache();
    return crow::response(204);
  });
}

}  // namespace ddns::api::routes
