#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace tpl::common {

/// Base error for all application-level exceptions.
/// Carries HTTP status code and machine-readable error code slug.
struct AppError : public std::runtime_error {
  int _iHttpStatus;
  std::string _sErrorCode;

  explicit AppError(int iHttpStatus, std::string sCode, std::string sMsg)
      : std::runtime_error(std::move(sMsg)),
        _iHttpStatus(iHttpStatus),
        _sErrorCode(std::move(sCode)) {}
};

/// 400 Bad Request: request envelope failures (API body, CLI usage).
struct ValidationError : AppError {
  explicit ValidationError(std::string sCode, std::string sMsg)
      : AppError(400, std::move(sCode), std::move(sMsg)) {}
};

/// Discriminates the binding failures surfaced to callers.
enum class BindingErrorKind {
  MissingParameter,
  InvalidParameterValue,
  UnresolvedReference,
  CyclicVariableReference,
  MalformedDocument,
  ExpressionEvaluation
};

/// Returns the stable slug for a binding error kind (also the error code).
const char* toString(BindingErrorKind eKind);

/// Base of every failure raised while parsing or binding a template.
/// _sName identifies the offending parameter, variable, resource or location.
struct BindingError : AppError {
  BindingErrorKind _eKind;
  std::string _sName;

  explicit BindingError(int iHttpStatus, BindingErrorKind eKind, std::string sName,
                        std::string sMsg)
      : AppError(iHttpStatus, toString(eKind), std::move(sMsg)),
        _eKind(eKind),
        _sName(std::move(sName)) {}
};

/// 400: a required parameter has no value and no default.
struct MissingParameterError : BindingError {
  explicit MissingParameterError(std::string sName, std::string sMsg)
      : BindingError(400, BindingErrorKind::MissingParameter, std::move(sName),
                     std::move(sMsg)) {}
};

/// 400: a parameter value has the wrong type, is outside the allowed set or bounds,
/// or names a parameter the template does not declare.
struct InvalidParameterValueError : BindingError {
  explicit InvalidParameterValueError(std::string sName, std::string sMsg)
      : BindingError(400, BindingErrorKind::InvalidParameterValue, std::move(sName),
                     std::move(sMsg)) {}
};

/// 422: an expression references an undeclared parameter, variable or resource.
struct UnresolvedReferenceError : BindingError {
  explicit UnresolvedReferenceError(std::string sName, std::string sMsg)
      : BindingError(422, BindingErrorKind::UnresolvedReference, std::move(sName),
                     std::move(sMsg)) {}
};

/// 422: the variable reference graph contains a cycle.
struct CyclicVariableReferenceError : BindingError {
  explicit CyclicVariableReferenceError(std::string sName, std::string sMsg)
      : BindingError(422, BindingErrorKind::CyclicVariableReference, std::move(sName),
                     std::move(sMsg)) {}
};

/// 400: schema violation in the document or syntax error in an expression.
struct MalformedDocumentError : BindingError {
  explicit MalformedDocumentError(std::string sName, std::string sMsg)
      : BindingError(400, BindingErrorKind::MalformedDocument, std::move(sName),
                     std::move(sMsg)) {}
};

/// 422: a well-formed expression failed at evaluation time (bad argument types,
/// division by zero, output type mismatch).
struct ExpressionEvaluationError : BindingError {
  explicit ExpressionEvaluationError(std::string sName, std::string sMsg)
      : BindingError(422, BindingErrorKind::ExpressionEvaluation, std::move(sName),
                     std::move(sMsg)) {}
};

}  // namespace tpl::common
