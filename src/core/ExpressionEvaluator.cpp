#include "core/ExpressionEvaluator.hpp"

#include "common/Errors.hpp"
#include "common/Types.hpp"

namespace tpl::core {

namespace {

EvalResult valueOf(nlohmann::json jValue) {
  EvalResult er;
  er.jValue = std::move(jValue);
  return er;
}

EvalResult residualOf(ExprPtr upNode) {
  EvalResult er;
  er.upResidual = std::move(upNode);
  return er;
}

/// Turn a partial result back into a node so it can be embedded in a residual.
ExprPtr toNode(EvalResult&& er) {
  if (er.isResidual()) {
    return std::move(er.upResidual);
  }
  return makeLiteral(std::move(er.jValue));
}

}  // namespace

ExpressionEvaluator::ExpressionEvaluator(IEvaluationScope& scope,
                                         const ExpressionParser& epParser,
                                         const FunctionLibrary& flLibrary)
    : _scope(scope), _epParser(epParser), _flLibrary(flLibrary) {}

ExpressionEvaluator::~ExpressionEvaluator() = default;

EvalResult ExpressionEvaluator::evaluate(const ExprNode& enNode,
                                         const std::string& sLocation) const {
  switch (enNode.kind) {
    case ExprNode::Kind::Literal:
      return valueOf(enNode.jLiteral);

    case ExprNode::Kind::Call:
      return evaluateCall(enNode, sLocation);

    case ExprNode::Kind::Member: {
      EvalResult erTarget = evaluate(*enNode.vChildren[0], sLocation);
      if (erTarget.isResidual()) {
        return residualOf(makeMember(std::move(erTarget.upResidual), enNode.sName));
      }
      return valueOf(member(erTarget.jValue, enNode.sName, sLocation));
    }

    case ExprNode::Kind::Index: {
      EvalResult erTarget = evaluate(*enNode.vChildren[0], sLocation);
      EvalResult erIndex = evaluate(*enNode.vChildren[1], sLocation);
      if (erTarget.isResidual() || erIndex.isResidual()) {
        return residualOf(makeIndex(toNode(std::move(erTarget)), toNode(std::move(erIndex))));
      }
      return valueOf(index(erTarget.jValue, erIndex.jValue, sLocation));
    }
  }
  throw common::MalformedDocumentError(sLocation, "Unsupported expression node");
}

EvalResult ExpressionEvaluator::evaluateCall(const ExprNode& enNode,
                                             const std::string& sLocation) const {
  if (common::toLowerAscii(enNode.sName) == "if") {
    return evaluateIf(enNode, sLocation);
  }

  std::vector<EvalResult> vArgs;
  vArgs.reserve(enNode.vChildren.size());
  bool bResidual = FunctionLibrary::isRuntimeFunction(enNode.sName);
  for (const auto& upChild : enNode.vChildren) {
    vArgs.push_back(evaluate(*upChild, sLocation));
    bResidual = bResidual || vArgs.back().isResidual();
  }

  if (bResidual) {
    std::vector<ExprPtr> vNodes;
    vNodes.reserve(vArgs.size());
    for (auto& er : vArgs) {
      vNodes.push_back(toNode(std::move(er)));
    }
    return residualOf(makeCall(enNode.sName, std::move(vNodes)));
  }

  std::vector<nlohmann::json> vValues;
  vValues.reserve(vArgs.size());
  for (auto& er : vArgs) {
    vValues.push_back(std::move(er.jValue));
  }
  return valueOf(_flLibrary.call(enNode.sName, vValues, _scope, sLocation));
}

EvalResult ExpressionEvaluator::evaluateIf(const ExprNode& enNode,
                                           const std::string& sLocation) const {
  if (enNode.vChildren.size() != 3) {
    throw common::ExpressionEvaluationError(
        sLocation, "Function 'if': expects 3 argument(s), got " +
                       std::to_string(enNode.vChildren.size()));
  }

  EvalResult erCondition = evaluate(*enNode.vChildren[0], sLocation);
  if (erCondition.isResidual()) {
    std::vector<ExprPtr> vNodes;
    vNodes.push_back(std::move(erCondition.upResidual));
    vNodes.push_back(toNode(evaluate(*enNode.vChildren[1], sLocation)));
    vNodes.push_back(toNode(evaluate(*enNode.vChildren[2], sLocation)));
    return residualOf(makeCall(enNode.sName, std::move(vNodes)));
  }

  if (!erCondition.jValue.is_boolean()) {
    throw common::ExpressionEvaluationError(
        sLocation, "Function 'if': argument 1 must be a bool");
  }
  // Only the selected branch is evaluated
  return evaluate(*enNode.vChildren[erCondition.jValue.get<bool>() ? 1 : 2], sLocation);
}

nlohmann::json ExpressionEvaluator::member(const nlohmann::json& jTarget,
                                           const std::string& sMember,
                                           const std::string& sLocation) const {
  if (!jTarget.is_object()) {
    throw common::ExpressionEvaluationError(
        sLocation, "Cannot read property '" + sMember + "' of a non-object value");
  }
  auto it = jTarget.find(sMember);
  if (it != jTarget.end()) {
    return *it;
  }
  // Property names are case-insensitive
  const std::string sKey = common::toLowerAscii(sMember);
  for (const auto& [sItemKey, jItem] : jTarget.items()) {
    if (common::toLowerAscii(sItemKey) == sKey) {
      return jItem;
    }
  }
  throw common::ExpressionEvaluationError(
      sLocation, "Property '" + sMember + "' does not exist on the object");
}

nlohmann::json ExpressionEvaluator::index(const nlohmann::json& jTarget,
                                          const nlohmann::json& jIndex,
                                          const std::string& sLocation) const {
  if (jTarget.is_array()) {
    if (!jIndex.is_number_integer()) {
      throw common::ExpressionEvaluationError(sLocation, "Array index must be an int");
    }
    const auto iIndex = jIndex.get<int64_t>();
    if (iIndex < 0 || iIndex >= static_cast<int64_t>(jTarget.size())) {
      throw common::ExpressionEvaluationError(
          sLocation, "Array index " + std::to_string(iIndex) + " is out of range (size " +
                         std::to_string(jTarget.size()) + ")");
    }
    return jTarget[static_cast<size_t>(iIndex)];
  }
  if (jTarget.is_object() && jIndex.is_string()) {
    return member(jTarget, jIndex.get<std::string>(), sLocation);
  }
  throw common::ExpressionEvaluationError(sLocation,
                                          "Value cannot be indexed with the given key");
}

nlohmann::json ExpressionEvaluator::resolveValue(const nlohmann::json& jValue,
                                                 const std::string& sLocation,
                                                 std::vector<std::string>* pvDeferred) const {
  if (jValue.is_string()) {
    const auto& sValue = jValue.get_ref<const std::string&>();
    if (!ExpressionParser::isExpression(sValue)) {
      return ExpressionParser::unescapeLiteral(sValue);
    }
    auto upExpr = _epParser.parse(sValue, sLocation);
    EvalResult er = evaluate(*upExpr, sLocation);
    if (!er.isResidual()) {
      return std::move(er.jValue);
    }
    if (pvDeferred == nullptr) {
      throw common::ExpressionEvaluationError(
          sLocation, "Runtime functions (reference, list*) are not allowed here: " + sValue);
    }
    pvDeferred->push_back(sLocation);
    return "[" + writeExpression(*er.upResidual) + "]";
  }

  if (jValue.is_object()) {
    nlohmann::json jResult = nlohmann::json::object();
    for (const auto& [sKey, jItem] : jValue.items()) {
      jResult[sKey] = resolveValue(jItem, sLocation + "/" + sKey, pvDeferred);
    }
    return jResult;
  }

  if (jValue.is_array()) {
    nlohmann::json jResult = nlohmann::json::array();
    for (size_t i = 0; i < jValue.size(); ++i) {
      jResult.push_back(resolveValue(jValue[i], sLocation + "/" + std::to_string(i), pvDeferred));
    }
    return jResult;
  }

  return jValue;
}

}  // namespace tpl::core
