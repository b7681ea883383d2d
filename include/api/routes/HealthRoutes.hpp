#pragma once

#include <crow.h>

namespace tpl::api::routes {

/// Handler for /api/v1/health
/// Class abbreviation: hr
class HealthRoutes {
 public:
  HealthRoutes();
  ~HealthRoutes();

  void registerRoutes(crow::SimpleApp& app);
};

}  // namespace tpl::api::routes
