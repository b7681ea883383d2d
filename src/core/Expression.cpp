#include "core/Expression.hpp"

#include "common/Types.hpp"

namespace tpl::core {

namespace {

std::string quote(const std::string& sValue) {
  std::string sOut = "'";
  for (char c : sValue) {
    if (c == '\'') sOut += '\'';
    sOut += c;
  }
  sOut += '\'';
  return sOut;
}

std::string writeLiteral(const nlohmann::json& jValue) {
  if (jValue.is_string()) {
    return quote(jValue.get<std::string>());
  }
  if (jValue.is_number_integer()) {
    return jValue.dump();
  }
  if (jValue.is_boolean()) {
    return jValue.get<bool>() ? "true()" : "false()";
  }
  if (jValue.is_null()) {
    return "null()";
  }
  return "json(" + quote(jValue.dump()) + ")";
}

}  // namespace

ExprPtr makeLiteral(nlohmann::json jValue) {
  auto upNode = std::make_unique<ExprNode>();
  upNode->kind = ExprNode::Kind::Literal;
  upNode->jLiteral = std::move(jValue);
  return upNode;
}

ExprPtr makeCall(std::string sName, std::vector<ExprPtr> vArgs) {
  auto upNode = std::make_unique<ExprNode>();
  upNode->kind = ExprNode::Kind::Call;
  upNode->sName = std::move(sName);
  upNode->vChildren = std::move(vArgs);
  return upNode;
}

ExprPtr makeMember(ExprPtr upTarget, std::string sMember) {
  auto upNode = std::make_unique<ExprNode>();
  upNode->kind = ExprNode::Kind::Member;
  upNode->sName = std::move(sMember);
  upNode->vChildren.push_back(std::move(upTarget));
  return upNode;
}

ExprPtr makeIndex(ExprPtr upTarget, ExprPtr upIndex) {
  auto upNode = std::make_unique<ExprNode>();
  upNode->kind = ExprNode::Kind::Index;
  upNode->vChildren.push_back(std::move(upTarget));
  upNode->vChildren.push_back(std::move(upIndex));
  return upNode;
}

std::string writeExpression(const ExprNode& enNode) {
  switch (enNode.kind) {
    case ExprNode::Kind::Literal:
      return writeLiteral(enNode.jLiteral);
    case ExprNode::Kind::Call: {
      std::string sOut = enNode.sName + "(";
      for (size_t i = 0; i < enNode.vChildren.size(); ++i) {
        if (i > 0) sOut += ", ";
        sOut += writeExpression(*enNode.vChildren[i]);
      }
      return sOut + ")";
    }
    case ExprNode::Kind::Member:
      return writeExpression(*enNode.vChildren[0]) + "." + enNode.sName;
    case ExprNode::Kind::Index:
      return writeExpression(*enNode.vChildren[0]) + "[" +
             writeExpression(*enNode.vChildren[1]) + "]";
  }
  return {};
}

void collectReferences(const ExprNode& enNode, std::vector<ExprReference>& vOut) {
  if (enNode.kind == ExprNode::Kind::Call && !enNode.vChildren.empty()) {
    const auto& enFirst = *enNode.vChildren[0];
    const bool bLiteralName =
        enFirst.kind == ExprNode::Kind::Literal && enFirst.jLiteral.is_string();
    const std::string sFn = common::toLowerAscii(enNode.sName);
    if (bLiteralName && sFn == "parameters") {
      vOut.push_back({ExprReference::Kind::Parameter, enFirst.jLiteral.get<std::string>()});
    } else if (bLiteralName && sFn == "variables") {
      vOut.push_back({ExprReference::Kind::Variable, enFirst.jLiteral.get<std::string>()});
    }
  }
  for (const auto& upChild : enNode.vChildren) {
    collectReferences(*upChild, vOut);
  }
}

}  // namespace tpl::core
