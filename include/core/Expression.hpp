#pragma once

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace tpl::core {

/// Node of a parsed template expression.
///
///   Literal: jLiteral holds a string or integer
///   Call:    sName is the function name, vChildren the arguments
///   Member:  vChildren[0] is the target, sName the property
///   Index:   vChildren[0] is the target, vChildren[1] the index expression
/// Class abbreviation: en
struct ExprNode {
  enum class Kind { Literal, Call, Member, Index };

  Kind kind = Kind::Literal;
  nlohmann::json jLiteral;
  std::string sName;
  std::vector<std::unique_ptr<ExprNode>> vChildren;
};

using ExprPtr = std::unique_ptr<ExprNode>;

ExprPtr makeLiteral(nlohmann::json jValue);
ExprPtr makeCall(std::string sName, std::vector<ExprPtr> vArgs);
ExprPtr makeMember(ExprPtr upTarget, std::string sMember);
ExprPtr makeIndex(ExprPtr upTarget, ExprPtr upIndex);

/// Render a node back to expression syntax (without the enclosing brackets).
/// Non-scalar literals are written as json('...').
std::string writeExpression(const ExprNode& enNode);

/// A literal-named parameters('x') or variables('x') reference.
struct ExprReference {
  enum class Kind { Parameter, Variable };
  Kind kind;
  std::string sName;
};

/// Collect every parameters()/variables() call whose first argument is a string
/// literal. Dynamically computed names are not reported.
void collectReferences(const ExprNode& enNode, std::vector<ExprReference>& vOut);

}  // namespace tpl::core
