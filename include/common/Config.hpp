#pragma once

#include <string>

namespace tpl::common {

/// Environment variable loader for the binder CLI and server.
/// Loads all env vars into a typed struct with validation.
/// Class abbreviation: cfg
struct Config {
  // ── Logging ───────────────────────────────────────────────────────────
  std::string sLogLevel = "info";

  // ── HTTP ──────────────────────────────────────────────────────────────
  int iHttpPort = 8080;
  int iHttpThreads = 4;
  int iMaxTemplateBytes = 4 * 1024 * 1024;

  // ── Binding ───────────────────────────────────────────────────────────
  int iMaxExpressionDepth = 64;
  bool bAllowUnknownParameters = false;

  // ── Deployment context ────────────────────────────────────────────────
  std::string sSubscriptionId = "00000000-0000-0000-0000-000000000000";
  std::string sTenantId = "00000000-0000-0000-0000-000000000000";
  std::string sResourceGroup = "default-rg";
  std::string sLocation = "westus";
  std::string sDeploymentName = "template-binder";
  std::string sDeploymentMode = "Incremental";

  /// Load and validate all config from environment variables.
  /// Every variable is optional; throws on invalid values.
  static Config load();

 private:
  /// Read an env var, return empty string if unset.
  static std::string getEnv(const char* pVarName);

  /// Read an env var, falling back to sDefault if unset or empty.
  static std::string getEnvString(const char* pVarName, const std::string& sDefault);

  /// Read an env var as int with a default value.
  static int getEnvInt(const char* pVarName, int iDefault);

  /// Read an env var as bool (true/false/1/0), default false.
  static bool getEnvBool(const char* pVarName, bool bDefault);
};

}  // namespace tpl::common
