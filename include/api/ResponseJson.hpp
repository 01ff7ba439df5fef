#pragma once

#include <nlohmann/json.hpp>

#include "common/Types.hpp"

namespace ddns::dal {
struct DeadLetterRow;
}

namespace ddns::api {

/// JSON shapes served by the HTTP routes. Absent values serialize as null.
nlohmann::json toJson(const common::BridgeStats& bs);
nlohmann::json toJson(const common::ResolverStats& rst);
nlohmann::json toJson(const common::ResolveResult& res);
nlohmann::json toJson(const common::BatchResolveResult& bres);
nlohmann::json toJson(const dal::DeadLetterRow& dlr);

}  // namespace ddns::api
