#pragma once

#include <map>
#include <string>

#include <nlohmann/json.hpp>

#include "common/Types.hpp"
#include "core/ExpressionParser.hpp"

namespace tpl::core {

/// Validates supplied parameter values against the template's declarations and
/// fills in defaults.
/// Class abbreviation: pb
class ParameterBinder {
 public:
  ParameterBinder(const common::Template& tmpl, const ExpressionParser& epParser,
                  bool bAllowUnknownParameters = false);
  ~ParameterBinder();

  /// Bind jSupplied (object of name → value) to the declared parameters.
  /// Returns declared name → value for every parameter.
  /// Throws common::MissingParameterError / common::InvalidParameterValueError.
  std::map<std::string, nlohmann::json> bind(const nlohmann::json& jSupplied,
                                             const common::DeploymentContext& dc) const;

  /// Check one value against a declaration's type, allowed values and bounds.
  static void validateValue(const common::ParameterDeclaration& pd, const nlohmann::json& jValue);

  /// Convert command-line text to the declared type ("5" → 5 for int, JSON for
  /// object/array, true/false for bool).
  static nlohmann::json coerceFromText(const common::ParameterDeclaration& pd,
                                       const std::string& sText);

 private:
  const common::Template& _tmpl;
  const ExpressionParser& _epParser;
  bool _bAllowUnknownParameters;
};

}  // namespace tpl::core
