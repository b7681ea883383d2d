#include "common/Config.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

namespace tpl::common {

std::string Config::getEnv(const char* pVarName) {
  const char* pValue = std::getenv(pVarName);
  return pValue ? std::string(pValue) : std::string{};
}

std::string Config::getEnvString(const char* pVarName, const std::string& sDefault) {
  const std::string sValue = getEnv(pVarName);
  return sValue.empty() ? sDefault : sValue;
}

int Config::getEnvInt(const char* pVarName, int iDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return iDefault;
  }
  size_t nConsumed = 0;
  int iValue = 0;
  try {
    iValue = std::stoi(sValue, &nConsumed);
  } catch (const std::exception&) {
    throw std::runtime_error(
        std::string("Invalid integer value for ") + pVarName + ": " + sValue);
  }
  if (nConsumed != sValue.size()) {
    throw std::runtime_error(
        std::string("Invalid integer value for ") + pVarName + ": " + sValue);
  }
  return iValue;
}

bool Config::getEnvBool(const char* pVarName, bool bDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return bDefault;
  }
  return sValue == "true" || sValue == "1" || sValue == "yes";
}

Config Config::load() {
  Config cfg;

  // Logging
  cfg.sLogLevel = getEnvString("TPL_LOG_LEVEL", cfg.sLogLevel);

  // HTTP
  cfg.iHttpPort = getEnvInt("TPL_HTTP_PORT", 8080);
  cfg.iHttpThreads = getEnvInt("TPL_HTTP_THREADS", 4);
  cfg.iMaxTemplateBytes = getEnvInt("TPL_MAX_TEMPLATE_BYTES", 4 * 1024 * 1024);

  // Binding
  cfg.iMaxExpressionDepth = getEnvInt("TPL_MAX_EXPRESSION_DEPTH", 64);
  cfg.bAllowUnknownParameters = getEnvBool("TPL_ALLOW_UNKNOWN_PARAMETERS", false);

  // Deployment context
  cfg.sSubscriptionId = getEnvString("TPL_SUBSCRIPTION_ID", cfg.sSubscriptionId);
  cfg.sTenantId = getEnvString("TPL_TENANT_ID", cfg.sTenantId);
  cfg.sResourceGroup = getEnvString("TPL_RESOURCE_GROUP", cfg.sResourceGroup);
  cfg.sLocation = getEnvString("TPL_LOCATION", cfg.sLocation);
  cfg.sDeploymentName = getEnvString("TPL_DEPLOYMENT_NAME", cfg.sDeploymentName);
  cfg.sDeploymentMode = getEnvString("TPL_DEPLOYMENT_MODE", cfg.sDeploymentMode);

  // ── Validation ─────────────────────────────────────────────────────────

  if (spdlog::level::from_str(cfg.sLogLevel) == spdlog::level::off && cfg.sLogLevel != "off") {
    throw std::runtime_error("TPL_LOG_LEVEL is not a valid level: " + cfg.sLogLevel);
  }

  if (cfg.iHttpPort < 1 || cfg.iHttpPort > 65535) {
    throw std::runtime_error(
        "TPL_HTTP_PORT must be in 1..65535 (got " + std::to_string(cfg.iHttpPort) + ")");
  }

  if (cfg.iHttpThreads < 1) {
    throw std::runtime_error(
        "TPL_HTTP_THREADS must be >= 1 (got " + std::to_string(cfg.iHttpThreads) + ")");
  }

  if (cfg.iMaxTemplateBytes < 1024) {
    throw std::runtime_error(
        "TPL_MAX_TEMPLATE_BYTES must be >= 1024 (got " +
        std::to_string(cfg.iMaxTemplateBytes) + ")");
  }

  if (cfg.iMaxExpressionDepth < 1) {
    throw std::runtime_error(
        "TPL_MAX_EXPRESSION_DEPTH must be >= 1 (got " +
        std::to_string(cfg.iMaxExpressionDepth) + ")");
  }

  if (cfg.sDeploymentMode != "Incremental" && cfg.sDeploymentMode != "Complete") {
    throw std::runtime_error(
        "TPL_DEPLOYMENT_MODE must be 'Incremental' or 'Complete' (got '" +
        cfg.sDeploymentMode + "')");
  }

  return cfg;
}

}  // namespace tpl::common
