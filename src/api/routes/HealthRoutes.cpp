#include "api/routes/HealthRoutes.hpp"

#include <nlohmann/json.hpp>

namespace tpl::api::routes {

HealthRoutes::HealthRoutes() = default;
HealthRoutes::~HealthRoutes() = default;

void HealthRoutes::registerRoutes(crow::SimpleApp& app) {
  // GET /api/v1/health
  CROW_ROUTE(app, "/api/v1/health").methods("GET"_method)([]() -> crow::response {
    nlohmann::json jResp = {{"status", "ok"}};
    crow::response resp(200, jResp.dump(2));
    resp.set_header("Content-Type", "application/json");
    return resp;
  });
}

}  // namespace tpl::api::routes
