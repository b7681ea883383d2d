#include "api/routes/TemplateRoutes.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/DeploymentRequest.hpp"
#include "core/TemplateBinder.hpp"
#include "core/TemplateParser.hpp"

#include <nlohmann/json.hpp>

namespace tpl::api::routes {

namespace {

crow::response jsonResponse(int iStatus, const nlohmann::json& jBody) {
  crow::response resp(iStatus, jBody.dump(2));
  resp.set_header("Content-Type", "application/json");
  return resp;
}

crow::response errorResponse(const common::AppError& e) {
  nlohmann::json jErr = {{"error", e._sErrorCode}, {"message", e.what()}};
  if (const auto* pBinding = dynamic_cast<const common::BindingError*>(&e)) {
    jErr["name"] = pBinding->_sName;
  }
  return jsonResponse(e._iHttpStatus, jErr);
}

/// The request body is {"template": {...}, "parameters": {...}}.
const nlohmann::json& requireTemplate(const nlohmann::json& jBody) {
  if (!jBody.is_object() || !jBody.contains("template") || !jBody["template"].is_object()) {
    throw common::ValidationError("missing_template", "Request body must contain a 'template' object");
  }
  return jBody["template"];
}

}  // namespace

TemplateRoutes::TemplateRoutes(const core::TemplateParser& tpParser,
                               const core::TemplateBinder& tbBinder)
    : _tpParser(tpParser), _tbBinder(tbBinder) {}

TemplateRoutes::~TemplateRoutes() = default;

void TemplateRoutes::registerRoutes(crow::SimpleApp& app) {
  // POST /api/v1/templates/validate
  CROW_ROUTE(app, "/api/v1/templates/validate").methods("POST"_method)(
      [this](const crow::request& req) -> crow::response {
        try {
          auto jBody = nlohmann::json::parse(req.body);
          auto tmpl = _tpParser.parse(requireTemplate(jBody));
          _tbBinder.validate(tmpl);

          nlohmann::json jParams = nlohmann::json::array();
          for (const auto& pd : tmpl.vParameters) {
            jParams.push_back({{"name", pd.sName},
                               {"type", common::toString(pd.type)},
                               {"required", pd.isRequired()}});
          }
          nlohmann::json jResp = {{"valid", true},
                                  {"contentVersion", tmpl.sContentVersion},
                                  {"parameters", std::move(jParams)},
                                  {"resourceCount", tmpl.vResources.size()}};
          return jsonResponse(200, jResp);
        } catch (const common::AppError& e) {
          return errorResponse(e);
        } catch (const nlohmann::json::exception&) {
          nlohmann::json jErr = {{"error", "invalid_json"}, {"message", "Invalid JSON body"}};
          return jsonResponse(400, jErr);
        }
      });

  // POST /api/v1/templates/bind
  CROW_ROUTE(app, "/api/v1/templates/bind").methods("POST"_method)(
      [this](const crow::request& req) -> crow::response {
        try {
          auto jBody = nlohmann::json::parse(req.body);
          auto tmpl = _tpParser.parse(requireTemplate(jBody));
          nlohmann::json jValues = nlohmann::json::object();
          if (jBody.contains("parameters")) {
            jValues = core::TemplateParser::parseParameterValues(jBody["parameters"]);
          }

          auto rt = _tbBinder.bind(tmpl, jValues);

          nlohmann::json jResp = {
              {"deployment", core::DeploymentRequest::build(rt, _tbBinder.options().dcContext)},
              {"parameters", core::DeploymentRequest::redactParameters(rt)},
              {"variables", rt.mVariables},
              {"outputs", rt.mOutputs},
              {"deferred", rt.vDeferredLocations},
          };
          return jsonResponse(200, jResp);
        } catch (const common::AppError& e) {
          common::Logger::get()->info("Bind request rejected: {} ({})", e._sErrorCode, e.what());
          return errorResponse(e);
        } catch (const nlohmann::json::exception&) {
          nlohmann::json jErr = {{"error", "invalid_json"}, {"message", "Invalid JSON body"}};
          return jsonResponse(400, jErr);
        }
      });
}

}  // namespace tpl::api::routes
