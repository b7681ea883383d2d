#pragma once

#include <string>

#include "core/Expression.hpp"

namespace tpl::core {

/// Tokenizes and parses the bracketed template expression language:
///
///   expr     := primary accessor*
///   primary  := 'string' | integer | identifier '(' [expr (',' expr)*] ')'
///   accessor := '.' identifier | '[' expr ']'
///
/// Syntax errors throw common::MalformedDocumentError naming sLocation (or the
/// expression text when no location is given).
/// Class abbreviation: ep
class ExpressionParser {
 public:
  explicit ExpressionParser(int iMaxDepth = 64);
  ~ExpressionParser();

  /// True if sValue is "[...]" and does not start with the "[[" escape.
  static bool isExpression(const std::string& sValue);

  /// Strip the "[[" escape from a bracketed literal ("[[x]" becomes "[x]");
  /// other strings are returned as-is.
  static std::string unescapeLiteral(const std::string& sValue);

  /// Inverse of unescapeLiteral(): prefix any "[...]" string with "[" so it is
  /// read back as a literal.
  static std::string escapeLiteral(const std::string& sValue);

  /// Parse an expression. Enclosing brackets are optional.
  ExprPtr parse(const std::string& sExpression, const std::string& sLocation = {}) const;

 private:
  int _iMaxDepth;
};

}  // namespace tpl::core
