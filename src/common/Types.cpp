#include "common/Types.hpp"

#include <algorithm>
#include <cctype>

namespace tpl::common {

std::string toLowerAscii(const std::string& sValue) {
  std::string sLower = sValue;
  std::transform(sLower.begin(), sLower.end(), sLower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return sLower;
}

std::optional<ParameterType> parameterTypeFromString(const std::string& sType) {
  const std::string sLower = toLowerAscii(sType);
  if (sLower == "string") return ParameterType::String;
  if (sLower == "securestring") return ParameterType::SecureString;
  if (sLower == "int") return ParameterType::Int;
  if (sLower == "bool") return ParameterType::Bool;
  if (sLower == "object") return ParameterType::Object;
  if (sLower == "secureobject") return ParameterType::SecureObject;
  if (sLower == "array") return ParameterType::Array;
  return std::nullopt;
}

std::string toString(ParameterType type) {
  switch (type) {
    case ParameterType::String:
      return "string";
    case ParameterType::SecureString:
      return "securestring";
    case ParameterType::Int:
      return "int";
    case ParameterType::Bool:
      return "bool";
    case ParameterType::Object:
      return "object";
    case ParameterType::SecureObject:
      return "secureobject";
    case ParameterType::Array:
      return "array";
  }
  return "string";
}

bool isSecure(ParameterType type) {
  return type == ParameterType::SecureString || type == ParameterType::SecureObject;
}

bool matchesType(ParameterType type, const nlohmann::json& jValue) {
  switch (type) {
    case ParameterType::String:
    case ParameterType::SecureString:
      return jValue.is_string();
    case ParameterType::Int:
      return jValue.is_number_integer();
    case ParameterType::Bool:
      return jValue.is_boolean();
    case ParameterType::Object:
    case ParameterType::SecureObject:
      return jValue.is_object();
    case ParameterType::Array:
      return jValue.is_array();
  }
  return false;
}

const ParameterDeclaration* Template::findParameter(const std::string& sName) const {
  const std::string sKey = toLowerAscii(sName);
  for (const auto& pd : vParameters) {
    if (toLowerAscii(pd.sName) == sKey) {
      return &pd;
    }
  }
  return nullptr;
}

const VariableExpression* Template::findVariable(const std::string& sName) const {
  const std::string sKey = toLowerAscii(sName);
  for (const auto& vx : vVariables) {
    if (toLowerAscii(vx.sName) == sKey) {
      return &vx;
    }
  }
  return nullptr;
}

const ResolvedResource* ResolvedTemplate::findResource(const std::string& sName) const {
  auto it = mResources.find(sName);
  return it == mResources.end() ? nullptr : &it->second;
}

}  // namespace tpl::common
