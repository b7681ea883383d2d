#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace tpl::common {

/// Declared type of a template parameter or output.
enum class ParameterType { String, SecureString, Int, Bool, Object, SecureObject, Array };

/// Parse a declared type name (case-insensitive). Returns nullopt for unknown names.
std::optional<ParameterType> parameterTypeFromString(const std::string& sType);

/// Canonical template spelling of a type ("string", "securestring", ...).
std::string toString(ParameterType type);

/// True for securestring and secureobject.
bool isSecure(ParameterType type);

/// True if jValue has the JSON shape the declared type requires.
bool matchesType(ParameterType type, const nlohmann::json& jValue);

/// Lowercase copy of an ASCII string. Template names compare case-insensitively.
std::string toLowerAscii(const std::string& sValue);

/// Class abbreviation: pd
struct ParameterDeclaration {
  std::string sName;
  ParameterType type = ParameterType::String;
  std::optional<nlohmann::json> ojDefault;
  std::optional<std::vector<nlohmann::json>> ovAllowedValues;
  std::optional<int64_t> oiMinValue;
  std::optional<int64_t> oiMaxValue;
  std::optional<int64_t> oiMinLength;
  std::optional<int64_t> oiMaxLength;
  std::optional<std::string> osDescription;

  bool isRequired() const { return !ojDefault.has_value(); }
};

/// A template variable. jValue is an expression string or a JSON tree of them.
/// Class abbreviation: vx
struct VariableExpression {
  std::string sName;
  nlohmann::json jValue;
};

/// Resource iteration declared with "copy".
/// Class abbreviation: cl
struct CopyLoop {
  std::string sName;
  nlohmann::json jCount;
};

/// One resource as declared in the template.
/// Class abbreviation: rs
struct ResourceSpec {
  std::string sType;
  std::string sName;
  std::string sApiVersion;
  std::optional<std::string> osLocation;
  std::optional<nlohmann::json> ojCondition;
  std::optional<CopyLoop> oCopy;
  nlohmann::json jProperties = nlohmann::json::object();
  std::vector<std::string> vDependsOn;
  /// Pass-through fields (tags, sku, kind, plan, zones, identity, comments).
  nlohmann::json jExtra = nlohmann::json::object();
};

/// Class abbreviation: od
struct OutputDeclaration {
  std::string sName;
  ParameterType type = ParameterType::String;
  nlohmann::json jValue;
};

/// A parsed template document.
/// Class abbreviation: tmpl
struct Template {
  std::string sSchema;
  std::string sContentVersion;
  std::vector<ParameterDeclaration> vParameters;
  std::vector<VariableExpression> vVariables;
  std::vector<ResourceSpec> vResources;
  std::vector<OutputDeclaration> vOutputs;

  /// Case-insensitive lookups; nullptr if not declared.
  const ParameterDeclaration* findParameter(const std::string& sName) const;
  const VariableExpression* findVariable(const std::string& sName) const;
};

/// Ambient deployment scope read by resourceGroup(), subscription(), deployment()
/// and resourceId().
/// Class abbreviation: dc
struct DeploymentContext {
  std::string sSubscriptionId = "00000000-0000-0000-0000-000000000000";
  std::string sTenantId = "00000000-0000-0000-0000-000000000000";
  std::string sResourceGroup = "default-rg";
  std::string sLocation = "westus";
  std::string sDeploymentName = "template-binder";
  std::string sMode = "Incremental";
};

/// A resource with every expression substituted.
/// Class abbreviation: rr
struct ResolvedResource {
  std::string sType;
  std::string sName;
  std::string sApiVersion;
  std::optional<std::string> osLocation;
  nlohmann::json jProperties = nlohmann::json::object();
  /// Names of the resources this one depends on, in declaration order.
  std::vector<std::string> vDependsOn;
  nlohmann::json jExtra = nlohmann::json::object();
  std::string sResourceId;

  bool operator==(const ResolvedResource&) const = default;
};

/// Output of binding. Immutable once returned by TemplateBinder::bind().
/// Class abbreviation: rt
struct ResolvedTemplate {
  std::string sContentVersion;
  std::map<std::string, ResolvedResource> mResources;
  /// Resource names in template declaration order (copy instances expanded).
  std::vector<std::string> vResourceOrder;
  std::map<std::string, nlohmann::json> mOutputs;
  std::map<std::string, ParameterType> mOutputTypes;
  std::map<std::string, nlohmann::json> mParameters;
  std::map<std::string, nlohmann::json> mVariables;
  std::set<std::string> setSecureParameters;
  /// Locations ("resources/<name>/properties/...", "outputs/<name>") whose value
  /// is a residual runtime expression left for the deployment service.
  std::vector<std::string> vDeferredLocations;

  const ResolvedResource* findResource(const std::string& sName) const;

  bool operator==(const ResolvedTemplate&) const = default;
};

}  // namespace tpl::common
