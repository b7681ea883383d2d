#include "core/TemplateParser.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <fstream>
#include <set>
#include <sstream>

namespace tpl::core {

namespace {

constexpr const char* kDefaultContentVersion = "1.0.0.0";

// Resource keys with dedicated fields; anything else is passed through.
const std::set<std::string> kResourceKeys = {
    "type", "name", "apiVersion", "location", "condition", "copy", "properties", "dependsOn"};

[[noreturn]] void malformed(const std::string& sLocation, const std::string& sMsg) {
  throw common::MalformedDocumentError(sLocation, "Malformed template at '" + sLocation +
                                                      "': " + sMsg);
}

const nlohmann::json& requireObject(const nlohmann::json& jParent, const std::string& sKey,
                                    const std::string& sLocation) {
  const auto& jValue = jParent.at(sKey);
  if (!jValue.is_object()) {
    malformed(sLocation, "expected an object");
  }
  return jValue;
}

std::string requireString(const nlohmann::json& jObject, const std::string& sKey,
                          const std::string& sLocation) {
  auto it = jObject.find(sKey);
  if (it == jObject.end()) {
    malformed(sLocation, "'" + sKey + "' is required");
  }
  if (!it->is_string() || it->get_ref<const std::string&>().empty()) {
    malformed(sLocation + "/" + sKey, "expected a non-empty string");
  }
  return it->get<std::string>();
}

std::optional<int64_t> optionalInt(const nlohmann::json& jObject, const std::string& sKey,
                                   const std::string& sLocation) {
  auto it = jObject.find(sKey);
  if (it == jObject.end()) {
    return std::nullopt;
  }
  if (!it->is_number_integer()) {
    malformed(sLocation + "/" + sKey, "expected an integer");
  }
  return it->get<int64_t>();
}

common::ParameterType parseType(const nlohmann::json& jObject, const std::string& sLocation) {
  const std::string sType = requireString(jObject, "type", sLocation);
  const auto oType = common::parameterTypeFromString(sType);
  if (!oType) {
    malformed(sLocation + "/type", "unknown type '" + sType + "'");
  }
  return *oType;
}

common::ParameterDeclaration parseParameter(const std::string& sName, const nlohmann::json& jDecl,
                                            const std::string& sLocation) {
  if (!jDecl.is_object()) {
    malformed(sLocation, "expected an object");
  }

  common::ParameterDeclaration pd;
  pd.sName = sName;
  pd.type = parseType(jDecl, sLocation);

  if (auto it = jDecl.find("defaultValue"); it != jDecl.end()) {
    pd.ojDefault = *it;
  }

  if (auto it = jDecl.find("allowedValues"); it != jDecl.end()) {
    if (!it->is_array() || it->empty()) {
      malformed(sLocation + "/allowedValues", "expected a non-empty array");
    }
    pd.ovAllowedValues = it->get<std::vector<nlohmann::json>>();
  }

  pd.oiMinValue = optionalInt(jDecl, "minValue", sLocation);
  pd.oiMaxValue = optionalInt(jDecl, "maxValue", sLocation);
  pd.oiMinLength = optionalInt(jDecl, "minLength", sLocation);
  pd.oiMaxLength = optionalInt(jDecl, "maxLength", sLocation);

  if ((pd.oiMinValue || pd.oiMaxValue) && pd.type != common::ParameterType::Int) {
    malformed(sLocation, "minValue/maxValue apply only to int parameters");
  }
  if (pd.oiMinValue && pd.oiMaxValue && *pd.oiMinValue > *pd.oiMaxValue) {
    malformed(sLocation, "minValue is greater than maxValue");
  }
  if ((pd.oiMinLength && *pd.oiMinLength < 0) || (pd.oiMaxLength && *pd.oiMaxLength < 0)) {
    malformed(sLocation, "minLength/maxLength must not be negative");
  }

  if (auto it = jDecl.find("metadata"); it != jDecl.end() && it->is_object()) {
    if (auto itDesc = it->find("description"); itDesc != it->end() && itDesc->is_string()) {
      pd.osDescription = itDesc->get<std::string>();
    }
  }
  return pd;
}

common::ResourceSpec parseResource(const nlohmann::json& jRes, const std::string& sLocation) {
  if (!jRes.is_object()) {
    malformed(sLocation, "expected an object");
  }

  common::ResourceSpec rs;
  rs.sType = requireString(jRes, "type", sLocation);
  rs.sName = requireString(jRes, "name", sLocation);
  rs.sApiVersion = requireString(jRes, "apiVersion", sLocation);

  if (auto it = jRes.find("location"); it != jRes.end()) {
    if (!it->is_string()) {
      malformed(sLocation + "/location", "expected a string");
    }
    rs.osLocation = it->get<std::string>();
  }

  if (auto it = jRes.find("condition"); it != jRes.end()) {
    if (!it->is_boolean() && !it->is_string()) {
      malformed(sLocation + "/condition", "expected a bool or an expression");
    }
    rs.ojCondition = *it;
  }

  if (auto it = jRes.find("copy"); it != jRes.end()) {
    if (!it->is_object()) {
      malformed(sLocation + "/copy", "expected an object");
    }
    common::CopyLoop cl;
    cl.sName = requireString(*it, "name", sLocation + "/copy");
    auto itCount = it->find("count");
    if (itCount == it->end() || (!itCount->is_number_integer() && !itCount->is_string())) {
      malformed(sLocation + "/copy/count", "expected an integer or an expression");
    }
    cl.jCount = *itCount;
    rs.oCopy = cl;
  }

  if (auto it = jRes.find("properties"); it != jRes.end()) {
    if (!it->is_object()) {
      malformed(sLocation + "/properties", "expected an object");
    }
    rs.jProperties = *it;
  }

  if (auto it = jRes.find("dependsOn"); it != jRes.end()) {
    if (!it->is_array()) {
      malformed(sLocation + "/dependsOn", "expected an array");
    }
    for (size_t i = 0; i < it->size(); ++i) {
      const auto& jDep = (*it)[i];
      if (!jDep.is_string() || jDep.get_ref<const std::string&>().empty()) {
        malformed(sLocation + "/dependsOn/" + std::to_string(i), "expected a non-empty string");
      }
      rs.vDependsOn.push_back(jDep.get<std::string>());
    }
  }

  if (jRes.contains("resources")) {
    malformed(sLocation + "/resources",
              "nested resources are not supported; declare child resources at top level");
  }

  for (const auto& [sKey, jValue] : jRes.items()) {
    if (kResourceKeys.count(sKey) == 0) {
      rs.jExtra[sKey] = jValue;
    }
  }
  return rs;
}

}  // namespace

TemplateParser::TemplateParser(size_t nMaxBytes) : _nMaxBytes(nMaxBytes) {}
TemplateParser::~TemplateParser() = default;

nlohmann::json TemplateParser::parseJson(const std::string& sDocument,
                                         const std::string& sName) const {
  if (_nMaxBytes > 0 && sDocument.size() > _nMaxBytes) {
    throw common::MalformedDocumentError(
        sName, "Document is " + std::to_string(sDocument.size()) +
                   " bytes, exceeding the limit of " + std::to_string(_nMaxBytes));
  }
  try {
    return nlohmann::json::parse(sDocument);
  } catch (const nlohmann::json::parse_error& ex) {
    throw common::MalformedDocumentError(sName, std::string("Invalid JSON: ") + ex.what());
  }
}

std::string TemplateParser::readFile(const std::string& sPath) const {
  std::ifstream ifs(sPath);
  if (!ifs.is_open()) {
    throw common::MalformedDocumentError(sPath, "Cannot open file: " + sPath);
  }
  std::ostringstream oss;
  oss << ifs.rdbuf();
  return oss.str();
}

common::Template TemplateParser::parseDocument(const std::string& sDocument) const {
  return parse(parseJson(sDocument, "template"));
}

common::Template TemplateParser::parseFile(const std::string& sPath) const {
  common::Logger::get()->debug("Loading template from {}", sPath);
  return parse(parseJson(readFile(sPath), sPath));
}

common::Template TemplateParser::parse(const nlohmann::json& jDocument) const {
  if (!jDocument.is_object()) {
    malformed("$", "a template must be a JSON object");
  }

  common::Template tmpl;
  tmpl.sContentVersion = kDefaultContentVersion;

  if (auto it = jDocument.find("$schema"); it != jDocument.end()) {
    if (!it->is_string()) malformed("$schema", "expected a string");
    tmpl.sSchema = it->get<std::string>();
  }
  if (auto it = jDocument.find("contentVersion"); it != jDocument.end()) {
    if (!it->is_string()) malformed("contentVersion", "expected a string");
    tmpl.sContentVersion = it->get<std::string>();
  }

  std::set<std::string> setNames;

  // ── parameters ─────────────────────────────────────────────────────────
  if (jDocument.contains("parameters")) {
    const auto& jParams = requireObject(jDocument, "parameters", "parameters");
    for (const auto& [sName, jDecl] : jParams.items()) {
      const std::string sLocation = "parameters/" + sName;
      if (!setNames.insert("p:" + common::toLowerAscii(sName)).second) {
        malformed(sLocation, "duplicate parameter name (names are case-insensitive)");
      }
      tmpl.vParameters.push_back(parseParameter(sName, jDecl, sLocation));
    }
  }

  // ── variables ──────────────────────────────────────────────────────────
  if (jDocument.contains("variables")) {
    const auto& jVars = requireObject(jDocument, "variables", "variables");
    for (const auto& [sName, jValue] : jVars.items()) {
      const std::string sLocation = "variables/" + sName;
      if (sName == "copy") {
        malformed(sLocation, "variable copy loops are not supported");
      }
      if (!setNames.insert("v:" + common::toLowerAscii(sName)).second) {
        malformed(sLocation, "duplicate variable name (names are case-insensitive)");
      }
      tmpl.vVariables.push_back(common::VariableExpression{sName, jValue});
    }
  }

  // ── resources ──────────────────────────────────────────────────────────
  auto itResources = jDocument.find("resources");
  if (itResources == jDocument.end()) {
    malformed("resources", "'resources' is required");
  }
  if (!itResources->is_array()) {
    malformed("resources", "expected an array");
  }
  for (size_t i = 0; i < itResources->size(); ++i) {
    tmpl.vResources.push_back(
        parseResource((*itResources)[i], "resources/" + std::to_string(i)));
  }

  // ── outputs ────────────────────────────────────────────────────────────
  if (jDocument.contains("outputs")) {
    const auto& jOutputs = requireObject(jDocument, "outputs", "outputs");
    for (const auto& [sName, jOut] : jOutputs.items()) {
      const std::string sLocation = "outputs/" + sName;
      if (!jOut.is_object()) {
        malformed(sLocation, "expected an object");
      }
      if (!jOut.contains("value")) {
        malformed(sLocation, "'value' is required");
      }
      tmpl.vOutputs.push_back(common::OutputDeclaration{sName, parseType(jOut, sLocation),
                                                        jOut.at("value")});
    }
  }

  return tmpl;
}

nlohmann::json TemplateParser::parseParameterValues(const nlohmann::json& jDocument) {
  if (jDocument.is_null()) {
    return nlohmann::json::object();
  }
  if (!jDocument.is_object()) {
    malformed("parameters", "parameter values must be a JSON object");
  }

  // Deployment parameters file: {"$schema": ..., "parameters": {"x": {"value": ...}}}
  const bool bFileForm = jDocument.contains("parameters") && jDocument.at("parameters").is_object() &&
                         (jDocument.contains("$schema") || jDocument.contains("contentVersion") ||
                          jDocument.size() == 1);
  if (!bFileForm) {
    return jDocument;
  }

  nlohmann::json jValues = nlohmann::json::object();
  for (const auto& [sName, jEntry] : jDocument.at("parameters").items()) {
    const std::string sLocation = "parameters/" + sName;
    if (!jEntry.is_object() || !jEntry.contains("value")) {
      if (jEntry.is_object() && jEntry.contains("reference")) {
        malformed(sLocation, "key vault references are not supported");
      }
      malformed(sLocation, "expected an object with a 'value'");
    }
    jValues[sName] = jEntry.at("value");
  }
  return jValues;
}

nlohmann::json TemplateParser::parseParameterValuesFile(const std::string& sPath) const {
  return parseParameterValues(parseJson(readFile(sPath), sPath));
}

}  // namespace tpl::core
