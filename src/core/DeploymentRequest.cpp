#include "core/DeploymentRequest.hpp"

#include "core/ExpressionParser.hpp"

#include <set>
#include <string>

namespace tpl::core {

namespace {

/// Re-escape literal "[...]" strings under sLocation. Residual expressions at
/// locations in setDeferred are left for the deployment service to evaluate.
nlohmann::json escapeValue(const nlohmann::json& jValue, const std::string& sLocation,
                           const std::set<std::string>& setDeferred) {
  if (jValue.is_string()) {
    if (setDeferred.count(sLocation) > 0) {
      return jValue;
    }
    return ExpressionParser::escapeLiteral(jValue.get_ref<const std::string&>());
  }
  if (jValue.is_object()) {
    nlohmann::json jResult = nlohmann::json::object();
    for (const auto& [sKey, jItem] : jValue.items()) {
      jResult[sKey] = escapeValue(jItem, sLocation + "/" + sKey, setDeferred);
    }
    return jResult;
  }
  if (jValue.is_array()) {
    nlohmann::json jResult = nlohmann::json::array();
    for (size_t i = 0; i < jValue.size(); ++i) {
      jResult.push_back(escapeValue(jValue[i], sLocation + "/" + std::to_string(i), setDeferred));
    }
    return jResult;
  }
  return jValue;
}

std::set<std::string> deferredSet(const common::ResolvedTemplate& rt) {
  return std::set<std::string>(rt.vDeferredLocations.begin(), rt.vDeferredLocations.end());
}

}  // namespace

nlohmann::json DeploymentRequest::resourcesToJson(const common::ResolvedTemplate& rt) {
  const auto setDeferred = deferredSet(rt);
  nlohmann::json jResources = nlohmann::json::array();
  for (const auto& sName : rt.vResourceOrder) {
    const auto& rr = rt.mResources.at(sName);
    const std::string sLocation = "resources/" + rr.sName;

    nlohmann::json jResource = rr.jExtra.is_object()
                                   ? escapeValue(rr.jExtra, sLocation, setDeferred)
                                   : nlohmann::json::object();
    jResource["type"] = ExpressionParser::escapeLiteral(rr.sType);
    jResource["name"] = ExpressionParser::escapeLiteral(rr.sName);
    jResource["apiVersion"] = ExpressionParser::escapeLiteral(rr.sApiVersion);
    if (rr.osLocation.has_value()) {
      jResource["location"] = ExpressionParser::escapeLiteral(*rr.osLocation);
    }
    if (!rr.vDependsOn.empty()) {
      nlohmann::json jDeps = nlohmann::json::array();
      for (const auto& sDep : rr.vDependsOn) {
        const auto* pTarget = rt.findResource(sDep);
        jDeps.push_back(ExpressionParser::escapeLiteral(
            pTarget != nullptr && !pTarget->sResourceId.empty() ? pTarget->sResourceId : sDep));
      }
      jResource["dependsOn"] = std::move(jDeps);
    }
    jResource["properties"] = escapeValue(rr.jProperties, sLocation + "/properties", setDeferred);
    jResources.push_back(std::move(jResource));
  }
  return jResources;
}

nlohmann::json DeploymentRequest::build(const common::ResolvedTemplate& rt,
                                        const common::DeploymentContext& dc) {
  const auto setDeferred = deferredSet(rt);
  nlohmann::json jOutputs = nlohmann::json::object();
  for (const auto& [sName, jValue] : rt.mOutputs) {
    auto it = rt.mOutputTypes.find(sName);
    const std::string sType =
        it != rt.mOutputTypes.end() ? common::toString(it->second) : std::string("object");
    jOutputs[sName] = {{"type", sType},
                       {"value", escapeValue(jValue, "outputs/" + sName, setDeferred)}};
  }

  nlohmann::json jTemplate = {
      {"$schema", kSchema},
      {"contentVersion", rt.sContentVersion},
      {"resources", resourcesToJson(rt)},
      {"outputs", std::move(jOutputs)},
  };

  return {{"properties",
           {{"mode", dc.sMode},
            {"template", std::move(jTemplate)},
            {"parameters", nlohmann::json::object()}}}};
}

nlohmann::json DeploymentRequest::redactParameters(const common::ResolvedTemplate& rt) {
  nlohmann::json jParams = nlohmann::json::object();
  for (const auto& [sName, jValue] : rt.mParameters) {
    jParams[sName] = rt.setSecureParameters.count(sName) > 0 ? nlohmann::json("***") : jValue;
  }
  return jParams;
}

}  // namespace tpl::core
