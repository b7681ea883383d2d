#include "common/Errors.hpp"

namespace tpl::common {

const char* toString(BindingErrorKind eKind) {
  switch (eKind) {
    case BindingErrorKind::MissingParameter:
      return "missing_parameter";
    case BindingErrorKind::InvalidParameterValue:
      return "invalid_parameter_value";
    case BindingErrorKind::UnresolvedReference:
      return "unresolved_reference";
    case BindingErrorKind::CyclicVariableReference:
      return "cyclic_variable_reference";
    case BindingErrorKind::MalformedDocument:
      return "malformed_document";
    case BindingErrorKind::ExpressionEvaluation:
      return "expression_evaluation_failed";
  }
  return "binding_error";
}

}  // namespace tpl::common
