#pragma once

#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Types.hpp"
#include "core/ExpressionParser.hpp"
#include "core/IEvaluationScope.hpp"

namespace tpl::core {

/// Analyses and lazily resolves template variables.
/// One instance serves a single bind() call; resolved values are memoized.
/// Class abbreviation: ve
class VariableEngine {
 public:
  VariableEngine(const common::Template& tmpl, const ExpressionParser& epParser);
  ~VariableEngine();

  /// Variables referenced by literal name anywhere inside jValue, in order of
  /// first appearance, without duplicates.
  std::vector<std::string> listDependencies(const nlohmann::json& jValue,
                                            const std::string& sLocation) const;

  /// Static checks over the variable graph. Throws
  /// common::CyclicVariableReferenceError for a cycle (checked first) and
  /// common::UnresolvedReferenceError for a reference to an undeclared variable.
  void validate() const;

  /// Evaluate a variable through scope, memoizing the result. Runtime functions
  /// are rejected in variables. Throws common::UnresolvedReferenceError if the
  /// variable is not declared and common::CyclicVariableReferenceError if it is
  /// reached again while being evaluated.
  nlohmann::json resolve(const std::string& sName, IEvaluationScope& scope);

  /// Resolved values keyed by declared name.
  std::map<std::string, nlohmann::json> resolvedValues() const;

 private:
  void collect(const nlohmann::json& jValue, const std::string& sLocation,
               std::vector<std::string>& vOut) const;

  const common::Template& _tmpl;
  const ExpressionParser& _epParser;
  std::map<std::string, nlohmann::json> _mResolved;  // lowercase name → value
  std::vector<std::string> _vInProgress;             // lowercase names, evaluation stack
};

}  // namespace tpl::core
