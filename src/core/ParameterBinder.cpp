#include "core/ParameterBinder.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/ExpressionEvaluator.hpp"
#include "core/IEvaluationScope.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <vector>

namespace tpl::core {

namespace {

/// Scope for evaluating default values: parameters resolve to their bound value,
/// variables are not reachable.
class DefaultsScope : public IEvaluationScope {
 public:
  DefaultsScope(const common::Template& tmpl, const ExpressionParser& epParser,
                const std::map<std::string, nlohmann::json>& mSupplied,
                const common::DeploymentContext& dc)
      : _tmpl(tmpl), _epParser(epParser), _mSupplied(mSupplied), _dc(dc) {}

  nlohmann::json parameter(const std::string& sName) override {
    const auto* pDecl = _tmpl.findParameter(sName);
    if (pDecl == nullptr) {
      throw common::UnresolvedReferenceError(
          sName, "The template parameter '" + sName + "' is not declared");
    }
    return bindOne(*pDecl);
  }

  nlohmann::json variable(const std::string& sName) override {
    throw common::MalformedDocumentError(
        sName, "Parameter default values cannot reference variables ('" + sName + "')");
  }

  std::optional<int64_t> copyIndex(const std::string& /*sLoopName*/) const override {
    return std::nullopt;
  }

  const common::DeploymentContext& context() const override { return _dc; }

  nlohmann::json bindOne(const common::ParameterDeclaration& pd) {
    const std::string sKey = common::toLowerAscii(pd.sName);
    if (auto it = _mBound.find(sKey); it != _mBound.end()) {
      return it->second;
    }
    if (_setInProgress.count(sKey) > 0) {
      throw common::CyclicVariableReferenceError(
          pd.sName, "Parameter '" + pd.sName + "' default value references itself");
    }

    nlohmann::json jValue;
    if (auto it = _mSupplied.find(sKey); it != _mSupplied.end()) {
      jValue = it->second;
    } else if (pd.ojDefault.has_value()) {
      _setInProgress.insert(sKey);
      ExpressionEvaluator ee(*this, _epParser);
      try {
        jValue = ee.resolveValue(*pd.ojDefault, "parameters/" + pd.sName + "/defaultValue");
      } catch (...) {
        _setInProgress.erase(sKey);
        throw;
      }
      _setInProgress.erase(sKey);
    } else {
      throw common::MissingParameterError(
          pd.sName, "Required parameter '" + pd.sName + "' has no value and no default");
    }

    ParameterBinder::validateValue(pd, jValue);
    _mBound[sKey] = jValue;
    return jValue;
  }

 private:
  const common::Template& _tmpl;
  const ExpressionParser& _epParser;
  const std::map<std::string, nlohmann::json>& _mSupplied;  // lowercase name → value
  const common::DeploymentContext& _dc;
  std::map<std::string, nlohmann::json> _mBound;
  std::set<std::string> _setInProgress;
};

std::string describe(const nlohmann::json& jValue, common::ParameterType type) {
  if (common::isSecure(type)) {
    return "<secure value>";
  }
  return jValue.dump();
}

}  // namespace

ParameterBinder::ParameterBinder(const common::Template& tmpl, const ExpressionParser& epParser,
                                 bool bAllowUnknownParameters)
    : _tmpl(tmpl), _epParser(epParser), _bAllowUnknownParameters(bAllowUnknownParameters) {}

ParameterBinder::~ParameterBinder() = default;

std::map<std::string, nlohmann::json> ParameterBinder::bind(
    const nlohmann::json& jSupplied, const common::DeploymentContext& dc) const {
  if (!jSupplied.is_null() && !jSupplied.is_object()) {
    throw common::MalformedDocumentError("parameters",
                                         "Parameter values must be a JSON object");
  }

  std::map<std::string, nlohmann::json> mSupplied;
  if (jSupplied.is_object()) {
    for (const auto& [sName, jValue] : jSupplied.items()) {
      const auto* pDecl = _tmpl.findParameter(sName);
      if (pDecl == nullptr) {
        if (_bAllowUnknownParameters) {
          common::Logger::get()->warn("Ignoring value for undeclared parameter '{}'", sName);
          continue;
        }
        throw common::InvalidParameterValueError(
            sName, "Parameter '" + sName + "' is not declared in the template");
      }
      const std::string sKey = common::toLowerAscii(pDecl->sName);
      if (!mSupplied.emplace(sKey, jValue).second) {
        throw common::InvalidParameterValueError(
            pDecl->sName, "Parameter '" + pDecl->sName + "' is supplied more than once");
      }
    }
  }

  DefaultsScope scope(_tmpl, _epParser, mSupplied, dc);
  std::map<std::string, nlohmann::json> mBound;
  for (const auto& pd : _tmpl.vParameters) {
    mBound[pd.sName] = scope.bindOne(pd);
  }
  return mBound;
}

void ParameterBinder::validateValue(const common::ParameterDeclaration& pd,
                                    const nlohmann::json& jValue) {
  if (!common::matchesType(pd.type, jValue)) {
    throw common::InvalidParameterValueError(
        pd.sName, "Parameter '" + pd.sName + "' expects a value of type " +
                      common::toString(pd.type) + ", got " + std::string(jValue.type_name()));
  }

  if (pd.ovAllowedValues.has_value()) {
    const auto& vAllowed = *pd.ovAllowedValues;
    auto isAllowed = [&vAllowed](const nlohmann::json& jItem) {
      return std::find(vAllowed.begin(), vAllowed.end(), jItem) != vAllowed.end();
    };
    if (pd.type == common::ParameterType::Array) {
      for (const auto& jItem : jValue) {
        if (!isAllowed(jItem)) {
          throw common::InvalidParameterValueError(
              pd.sName, "Parameter '" + pd.sName + "' contains " + jItem.dump() +
                            ", which is not one of the allowed values");
        }
      }
    } else if (!isAllowed(jValue)) {
      throw common::InvalidParameterValueError(
          pd.sName, "Parameter '" + pd.sName + "' value " + describe(jValue, pd.type) +
                        " is not one of the allowed values");
    }
  }

  if (pd.type == common::ParameterType::Int) {
    const auto iValue = jValue.get<int64_t>();
    if (pd.oiMinValue && iValue < *pd.oiMinValue) {
      throw common::InvalidParameterValueError(
          pd.sName, "Parameter '" + pd.sName + "' value " + std::to_string(iValue) +
                        " is less than minValue " + std::to_string(*pd.oiMinValue));
    }
    if (pd.oiMaxValue && iValue > *pd.oiMaxValue) {
      throw common::InvalidParameterValueError(
          pd.sName, "Parameter '" + pd.sName + "' value " + std::to_string(iValue) +
                        " is greater than maxValue " + std::to_string(*pd.oiMaxValue));
    }
  }

  if (jValue.is_string() || jValue.is_array()) {
    const auto iLength = static_cast<int64_t>(
        jValue.is_string() ? jValue.get_ref<const std::string&>().size() : jValue.size());
    if (pd.oiMinLength && iLength < *pd.oiMinLength) {
      throw common::InvalidParameterValueError(
          pd.sName, "Parameter '" + pd.sName + "' length " + std::to_string(iLength) +
                        " is less than minLength " + std::to_string(*pd.oiMinLength));
    }
    if (pd.oiMaxLength && iLength > *pd.oiMaxLength) {
      throw common::InvalidParameterValueError(
          pd.sName, "Parameter '" + pd.sName + "' length " + std::to_string(iLength) +
                        " is greater than maxLength " + std::to_string(*pd.oiMaxLength));
    }
  }
}

nlohmann::json ParameterBinder::coerceFromText(const common::ParameterDeclaration& pd,
                                               const std::string& sText) {
  switch (pd.type) {
    case common::ParameterType::String:
    case common::ParameterType::SecureString:
      return sText;

    case common::ParameterType::Int: {
      try {
        size_t nConsumed = 0;
        const int64_t iValue = std::stoll(sText, &nConsumed);
        if (nConsumed == sText.size()) {
          return iValue;
        }
      } catch (const std::logic_error&) {
        // reported below
      }
      throw common::InvalidParameterValueError(
          pd.sName, "Parameter '" + pd.sName + "' expects an int, got '" + sText + "'");
    }

    case common::ParameterType::Bool: {
      const std::string sLower = common::toLowerAscii(sText);
      if (sLower == "true") return true;
      if (sLower == "false") return false;
      throw common::InvalidParameterValueError(
          pd.sName, "Parameter '" + pd.sName + "' expects true or false, got '" + sText + "'");
    }

    case common::ParameterType::Object:
    case common::ParameterType::SecureObject:
    case common::ParameterType::Array:
      try {
        return nlohmann::json::parse(sText);
      } catch (const nlohmann::json::parse_error&) {
        throw common::InvalidParameterValueError(
            pd.sName, "Parameter '" + pd.sName + "' expects JSON " + common::toString(pd.type));
      }
  }
  return sText;
}

}  // namespace tpl::core
