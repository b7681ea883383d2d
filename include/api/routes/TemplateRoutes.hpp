#pragma once

#include <crow.h>

namespace tpl::core {
class TemplateBinder;
class TemplateParser;
}  // namespace tpl::core

namespace tpl::api::routes {

/// Handlers for /api/v1/templates
/// Class abbreviation: tr
class TemplateRoutes {
 public:
  TemplateRoutes(const core::TemplateParser& tpParser, const core::TemplateBinder& tbBinder);
  ~TemplateRoutes();

  /// Register template routes on the Crow app.
  void registerRoutes(crow::SimpleApp& app);

 private:
  const core::TemplateParser& _tpParser;
  const core::TemplateBinder& _tbBinder;
};

}  // namespace tpl::api::routes
