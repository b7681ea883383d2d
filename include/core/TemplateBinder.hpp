#pragma once

#include <nlohmann/json.hpp>

#include "common/Config.hpp"
#include "common/Types.hpp"
#include "core/ExpressionParser.hpp"

namespace tpl::core {

/// Knobs for a TemplateBinder.
/// Class abbreviation: bo
struct BindOptions {
  common::DeploymentContext dcContext;
  int iMaxExpressionDepth = 64;
  bool bAllowUnknownParameters = false;

  static BindOptions fromConfig(const common::Config& cfg);
};

/// Binds parameter values to a template and evaluates every expression,
/// producing a ResolvedTemplate for the deployment service.
///
/// bind() is a pure function of its inputs: the binder holds no mutable state
/// and may be shared between threads.
/// Class abbreviation: tb
class TemplateBinder {
 public:
  explicit TemplateBinder(BindOptions boOptions = {});
  ~TemplateBinder();

  /// Checks that need no parameter values: variable reference cycles, expression
  /// syntax, unknown functions and references to undeclared parameters or
  /// variables. Throws a common::BindingError subclass.
  void validate(const common::Template& tmpl) const;

  /// validate(), then bind jParameterValues ({name: value}) and resolve
  /// variables, resources and outputs. Throws a common::BindingError subclass.
  common::ResolvedTemplate bind(const common::Template& tmpl,
                                const nlohmann::json& jParameterValues) const;

  const BindOptions& options() const { return _boOptions; }

 private:
  BindOptions _boOptions;
  ExpressionParser _epParser;
};

}  // namespace tpl::core
