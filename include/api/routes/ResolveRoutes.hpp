#pragma once

#include <crow.h>

namespace ddns::core {
class ResolutionEngine;
}

namespace ddns::api::routes {

/// Handlers for /api/v1/resolve and /api/v1/cache
/// Class abbreviation: rr
class ResolveRoutes {
 public:
  explicit ResolveRoutes(core::ResolutionEngine& reEngine);
  ~ResolveRoutes();

  void registerRoutes(crow::SimpleApp& app);

 private:
  core::ResolutionEngine& _reEngine;
};

}  // namespace ddns::api::routes
