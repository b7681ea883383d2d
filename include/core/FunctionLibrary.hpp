#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/IEvaluationScope.hpp"

namespace tpl::core {

/// Arguments shared by every built-in function invocation.
/// Class abbreviation: fc
struct FunctionCall {
  const std::string& sFunction;
  const std::string& sLocation;
  IEvaluationScope& scope;
};

using BuiltinFn =
    std::function<nlohmann::json(const std::vector<nlohmann::json>& vArgs, const FunctionCall& fc)>;

/// Immutable table of the built-in template functions, keyed by lowercase name.
/// Argument errors throw common::ExpressionEvaluationError; unknown names throw
/// common::MalformedDocumentError.
/// Class abbreviation: fl
class FunctionLibrary {
 public:
  /// Process-wide instance; safe to share across threads.
  static const FunctionLibrary& instance();

  /// True for built-ins and for functions the evaluator handles itself (if)
  /// or leaves for deployment time (reference, list*).
  bool contains(const std::string& sName) const;

  /// reference() and list*() need live resource state and are never evaluated.
  static bool isRuntimeFunction(const std::string& sName);

  nlohmann::json call(const std::string& sName, const std::vector<nlohmann::json>& vArgs,
                      IEvaluationScope& scope, const std::string& sLocation) const;

  /// Resource-group scoped id for a resource type and a '/'-separated name.
  /// Returns an empty string if the name has the wrong number of segments.
  static std::string resourceIdFor(const common::DeploymentContext& dc, const std::string& sType,
                                   const std::string& sName);

 private:
  FunctionLibrary();

  void registerScopeFunctions();
  void registerDeploymentFunctions();
  void registerStringFunctions();
  void registerCollectionFunctions();
  void registerLogicalFunctions();
  void registerNumericFunctions();

  std::unordered_map<std::string, BuiltinFn> _mFunctions;
};

}  // namespace tpl::core
