#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/Types.hpp"

namespace tpl::core {

/// Pure abstract interface through which expressions reach template state.
/// Implementations throw common::UnresolvedReferenceError for undeclared names.
class IEvaluationScope {
 public:
  virtual ~IEvaluationScope() = default;

  virtual nlohmann::json parameter(const std::string& sName) = 0;
  virtual nlohmann::json variable(const std::string& sName) = 0;

  /// Current iteration index of the named copy loop, or of the innermost loop
  /// when sLoopName is empty. nullopt outside any matching loop.
  virtual std::optional<int64_t> copyIndex(const std::string& sLoopName) const = 0;

  virtual const common::DeploymentContext& context() const = 0;
};

}  // namespace tpl::core
