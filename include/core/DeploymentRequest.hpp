#pragma once

#include <nlohmann/json.hpp>

#include "common/Types.hpp"

namespace tpl::core {

/// Renders a ResolvedTemplate as the body of a deployment request.
/// Class abbreviation: N/A (static interface)
class DeploymentRequest {
 public:
  DeploymentRequest() = delete;

  /// {"properties": {"mode": ..., "template": {...}, "parameters": {}}}.
  /// Parameters are already substituted, so the embedded template declares none
  /// and the parameters object is empty. Literal strings shaped like "[...]" are
  /// re-escaped; residual runtime expressions are written as expressions.
  static nlohmann::json build(const common::ResolvedTemplate& rt,
                              const common::DeploymentContext& dc);

  /// Resources in declaration order. dependsOn entries are written as resource
  /// ids where one could be formed.
  static nlohmann::json resourcesToJson(const common::ResolvedTemplate& rt);

  /// Bound parameter values with securestring/secureobject values replaced by "***".
  static nlohmann::json redactParameters(const common::ResolvedTemplate& rt);

  static constexpr const char* kSchema =
      "https://schema.management.azure.com/schemas/2015-01-01/deploymentTemplate.json#";
};

}  // namespace tpl::core
