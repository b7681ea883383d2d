#pragma once

#include <memory>
#include <string>

#include <crow.h>

namespace tpl::core {
class TemplateBinder;
class TemplateParser;
}  // namespace tpl::core

namespace tpl::api {

namespace routes {
class HealthRoutes;
class TemplateRoutes;
}  // namespace routes

/// Owns the Crow application instance; registers all routes at startup.
/// Class abbreviation: api
class ApiServer {
 public:
  ApiServer(const core::TemplateParser& tpParser, const core::TemplateBinder& tbBinder);
  ~ApiServer();

  void registerRoutes();

  /// Blocks until stop() is called or the process receives SIGINT/SIGTERM.
  void start(int iPort, int iThreads);
  void stop();

  crow::SimpleApp& app() { return _app; }

 private:
  crow::SimpleApp _app;
  std::unique_ptr<routes::HealthRoutes> _upHealthRoutes;
  std::unique_ptr<routes::TemplateRoutes> _upTemplateRoutes;
};

}  // namespace tpl::api
