#include "api/ApiServer.hpp"

#include "api/routes/HealthRoutes.hpp"
#include "api/routes/TemplateRoutes.hpp"
#include "common/Logger.hpp"

namespace tpl::api {

ApiServer::ApiServer(const core::TemplateParser& tpParser, const core::TemplateBinder& tbBinder)
    : _upHealthRoutes(std::make_unique<routes::HealthRoutes>()),
      _upTemplateRoutes(std::make_unique<routes::TemplateRoutes>(tpParser, tbBinder)) {}

ApiServer::~ApiServer() = default;

void ApiServer::registerRoutes() {
  _upHealthRoutes->registerRoutes(_app);
  _upTemplateRoutes->registerRoutes(_app);
  common::Logger::get()->debug("API routes registered");
}

void ApiServer::start(int iPort, int iThreads) {
  _app.loglevel(crow::LogLevel::Warning);
  _app.port(static_cast<uint16_t>(iPort)).concurrency(static_cast<uint16_t>(iThreads)).run();
}

void ApiServer::stop() { _app.stop(); }

}  // namespace tpl::api
