#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/Expression.hpp"
#include "core/ExpressionParser.hpp"
#include "core/FunctionLibrary.hpp"
#include "core/IEvaluationScope.hpp"

namespace tpl::core {

/// Outcome of partially evaluating an expression. Either a concrete value, or a
/// residual expression that still contains runtime functions.
/// Class abbreviation: er
struct EvalResult {
  nlohmann::json jValue;
  ExprPtr upResidual;

  bool isResidual() const { return upResidual != nullptr; }
};

/// Evaluates parsed expressions and template JSON values against a scope.
/// reference() and list*() calls are folded as far as their arguments allow and
/// otherwise left as residual expressions.
/// Class abbreviation: ee
class ExpressionEvaluator {
 public:
  ExpressionEvaluator(IEvaluationScope& scope, const ExpressionParser& epParser,
                      const FunctionLibrary& flLibrary = FunctionLibrary::instance());
  ~ExpressionEvaluator();

  EvalResult evaluate(const ExprNode& enNode, const std::string& sLocation) const;

  /// Resolve a template JSON value. Expression strings are evaluated, "[[" literals
  /// unescaped, objects and arrays resolved element-wise (keys are left as-is).
  ///
  /// With pvDeferred set, residual expressions are written back as "[...]" strings
  /// and their locations appended to *pvDeferred. With pvDeferred null a residual
  /// expression throws common::ExpressionEvaluationError.
  nlohmann::json resolveValue(const nlohmann::json& jValue, const std::string& sLocation,
                              std::vector<std::string>* pvDeferred = nullptr) const;

 private:
  EvalResult evaluateCall(const ExprNode& enNode, const std::string& sLocation) const;
  EvalResult evaluateIf(const ExprNode& enNode, const std::string& sLocation) const;
  nlohmann::json member(const nlohmann::json& jTarget, const std::string& sMember,
                        const std::string& sLocation) const;
  nlohmann::json index(const nlohmann::json& jTarget, const nlohmann::json& jIndex,
                       const std::string& sLocation) const;

  IEvaluationScope& _scope;
  const ExpressionParser& _epParser;
  const FunctionLibrary& _flLibrary;
};

}  // namespace tpl::core
