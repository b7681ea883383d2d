#include "core/TemplateBinder.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/ExpressionEvaluator.hpp"
#include "core/FunctionLibrary.hpp"
#include "core/IEvaluationScope.hpp"
#include "core/ParameterBinder.hpp"
#include "core/VariableEngine.hpp"

#include <algorithm>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace tpl::core {

namespace {

constexpr int64_t kMaxCopyCount = 800;

/// Scope for variables, resources and outputs once parameters are bound.
class BindingScope : public IEvaluationScope {
 public:
  BindingScope(const common::Template& tmpl,
               const std::map<std::string, nlohmann::json>& mParameters, VariableEngine& ve,
               const common::DeploymentContext& dc)
      : _tmpl(tmpl), _mParameters(mParameters), _ve(ve), _dc(dc) {}

  nlohmann::json parameter(const std::string& sName) override {
    const auto* pDecl = _tmpl.findParameter(sName);
    if (pDecl == nullptr) {
      throw common::UnresolvedReferenceError(
          sName, "The template parameter '" + sName + "' is not declared");
    }
    return _mParameters.at(pDecl->sName);
  }

  nlohmann::json variable(const std::string& sName) override { return _ve.resolve(sName, *this); }

  std::optional<int64_t> copyIndex(const std::string& sLoopName) const override {
    if (_vLoops.empty()) {
      return std::nullopt;
    }
    if (sLoopName.empty()) {
      return _vLoops.back().second;
    }
    const std::string sKey = common::toLowerAscii(sLoopName);
    for (auto it = _vLoops.rbegin(); it != _vLoops.rend(); ++it) {
      if (common::toLowerAscii(it->first) == sKey) {
        return it->second;
      }
    }
    return std::nullopt;
  }

  const common::DeploymentContext& context() const override { return _dc; }

  void pushLoop(const std::string& sName, int64_t iIndex) { _vLoops.emplace_back(sName, iIndex); }
  void popLoop() { _vLoops.pop_back(); }

 private:
  const common::Template& _tmpl;
  const std::map<std::string, nlohmann::json>& _mParameters;
  VariableEngine& _ve;
  const common::DeploymentContext& _dc;
  std::vector<std::pair<std::string, int64_t>> _vLoops;
};

/// One expanded resource (a copy loop contributes one instance per index).
struct ResourceInstance {
  common::ResolvedResource rr;
  std::string sLoopName;
  bool bActive = true;
  std::vector<std::string> vRawDependsOn;
};

/// Walks template values and checks every expression without evaluating it.
class ExpressionChecker {
 public:
  ExpressionChecker(const common::Template& tmpl, const ExpressionParser& epParser)
      : _tmpl(tmpl), _epParser(epParser), _flLibrary(FunctionLibrary::instance()) {}

  void check(const nlohmann::json& jValue, const std::string& sLocation,
             bool bParameterDefault = false) const {
    if (jValue.is_string()) {
      const auto& sValue = jValue.get_ref<const std::string&>();
      if (ExpressionParser::isExpression(sValue)) {
        checkExpression(*_epParser.parse(sValue, sLocation), sLocation, bParameterDefault);
      }
    } else if (jValue.is_object()) {
      for (const auto& [sKey, jItem] : jValue.items()) {
        check(jItem, sLocation + "/" + sKey, bParameterDefault);
      }
    } else if (jValue.is_array()) {
      for (size_t i = 0; i < jValue.size(); ++i) {
        check(jValue[i], sLocation + "/" + std::to_string(i), bParameterDefault);
      }
    }
  }

 private:
  void checkExpression(const ExprNode& enRoot, const std::string& sLocation,
                       bool bParameterDefault) const {
    std::function<void(const ExprNode&)> checkFunctions = [&](const ExprNode& enNode) {
      if (enNode.kind == ExprNode::Kind::Call && !_flLibrary.contains(enNode.sName)) {
        throw common::MalformedDocumentError(
            sLocation, "Unknown template function '" + enNode.sName + "' at '" + sLocation + "'");
      }
      for (const auto& upChild : enNode.vChildren) {
        checkFunctions(*upChild);
      }
    };
    checkFunctions(enRoot);

    std::vector<ExprReference> vRefs;
    collectReferences(enRoot, vRefs);
    for (const auto& ref : vRefs) {
      if (ref.kind == ExprReference::Kind::Parameter) {
        if (_tmpl.findParameter(ref.sName) == nullptr) {
          throw common::UnresolvedReferenceError(
              ref.sName, "Undeclared parameter '" + ref.sName + "' referenced at '" +
                             sLocation + "'");
        }
      } else if (bParameterDefault) {
        throw common::MalformedDocumentError(
            sLocation, "Parameter default values cannot reference variables ('" + ref.sName +
                           "')");
      } else if (_tmpl.findVariable(ref.sName) == nullptr) {
        throw common::UnresolvedReferenceError(
            ref.sName, "Undeclared variable '" + ref.sName + "' referenced at '" + sLocation +
                           "'");
      }
    }
  }

  const common::Template& _tmpl;
  const ExpressionParser& _epParser;
  const FunctionLibrary& _flLibrary;
};

std::string resolveString(const ExpressionEvaluator& ee, const std::string& sValue,
                          const std::string& sLocation) {
  const nlohmann::json jValue = ee.resolveValue(nlohmann::json(sValue), sLocation);
  if (!jValue.is_string()) {
    throw common::ExpressionEvaluationError(
        sLocation, "Expected a string at '" + sLocation + "', got " + jValue.type_name());
  }
  return jValue.get<std::string>();
}

int64_t resolveCopyCount(const ExpressionEvaluator& ee, const common::CopyLoop& cl,
                         const std::string& sLocation) {
  const nlohmann::json jCount = ee.resolveValue(cl.jCount, sLocation);
  if (!jCount.is_number_integer()) {
    throw common::ExpressionEvaluationError(sLocation,
                                            "Copy count must be an int at '" + sLocation + "'");
  }
  const auto iCount = jCount.get<int64_t>();
  if (iCount < 0 || iCount > kMaxCopyCount) {
    throw common::ExpressionEvaluationError(
        sLocation, "Copy count " + std::to_string(iCount) + " is outside 0.." +
                       std::to_string(kMaxCopyCount));
  }
  return iCount;
}

ResourceInstance resolveInstance(const common::ResourceSpec& rs, const std::string& sBase,
                                 const ExpressionEvaluator& ee,
                                 const common::DeploymentContext& dc,
                                 std::vector<std::string>& vDeferred) {
  ResourceInstance ri;
  auto& rr = ri.rr;
  rr.sName = resolveString(ee, rs.sName, sBase + "/name");
  rr.sType = resolveString(ee, rs.sType, sBase + "/type");
  rr.sResourceId = FunctionLibrary::resourceIdFor(dc, rr.sType, rr.sName);

  if (rs.ojCondition.has_value()) {
    const nlohmann::json jCondition = ee.resolveValue(*rs.ojCondition, sBase + "/condition");
    if (!jCondition.is_boolean()) {
      throw common::ExpressionEvaluationError(
          sBase + "/condition", "Resource condition must evaluate to a bool");
    }
    ri.bActive = jCondition.get<bool>();
    if (!ri.bActive) {
      return ri;
    }
  }

  const std::string sLocation = "resources/" + rr.sName;
  rr.sApiVersion = resolveString(ee, rs.sApiVersion, sLocation + "/apiVersion");
  if (rs.osLocation.has_value()) {
    rr.osLocation = resolveString(ee, *rs.osLocation, sLocation + "/location");
  }
  rr.jProperties = ee.resolveValue(rs.jProperties, sLocation + "/properties", &vDeferred);
  rr.jExtra = ee.resolveValue(rs.jExtra, sLocation, &vDeferred);
  for (size_t i = 0; i < rs.vDependsOn.size(); ++i) {
    ri.vRawDependsOn.push_back(
        resolveString(ee, rs.vDependsOn[i], sLocation + "/dependsOn/" + std::to_string(i)));
  }
  return ri;
}

/// Resolve dependsOn entries to resource names and reject unknown targets,
/// duplicate names and dependency cycles.
void linkDependencies(std::vector<ResourceInstance>& vInstances) {
  std::map<std::string, std::vector<size_t>> mLookup;
  std::map<std::string, size_t> mActiveNames;
  for (size_t i = 0; i < vInstances.size(); ++i) {
    const auto& ri = vInstances[i];
    const std::string sKey = common::toLowerAscii(ri.rr.sName);
    if (ri.bActive && !mActiveNames.emplace(sKey, i).second) {
      throw common::MalformedDocumentError(
          "resources/" + ri.rr.sName,
          "Resource name '" + ri.rr.sName + "' is declared more than once");
    }
    mLookup[sKey].push_back(i);
    mLookup[common::toLowerAscii(ri.rr.sType + "/" + ri.rr.sName)].push_back(i);
    if (!ri.rr.sResourceId.empty()) {
      mLookup[common::toLowerAscii(ri.rr.sResourceId)].push_back(i);
    }
    if (!ri.sLoopName.empty()) {
      mLookup[common::toLowerAscii(ri.sLoopName)].push_back(i);
    }
  }

  for (size_t i = 0; i < vInstances.size(); ++i) {
    auto& ri = vInstances[i];
    if (!ri.bActive) continue;
    for (const auto& sDep : ri.vRawDependsOn) {
      auto it = mLookup.find(common::toLowerAscii(sDep));
      if (it == mLookup.end()) {
        throw common::UnresolvedReferenceError(
            sDep, "Resource '" + ri.rr.sName + "' depends on '" + sDep +
                      "', which is not declared in the template");
      }
      for (size_t nTarget : it->second) {
        const auto& riTarget = vInstances[nTarget];
        if (!riTarget.bActive) {
          common::Logger::get()->debug("Dropping dependency of '{}' on skipped resource '{}'",
                                       ri.rr.sName, riTarget.rr.sName);
          continue;
        }
        if (nTarget == i) {
          throw common::MalformedDocumentError(
              "resources/" + ri.rr.sName, "Resource '" + ri.rr.sName + "' depends on itself");
        }
        auto& vDeps = ri.rr.vDependsOn;
        if (std::find(vDeps.begin(), vDeps.end(), riTarget.rr.sName) == vDeps.end()) {
          vDeps.push_back(riTarget.rr.sName);
        }
      }
    }
  }

  // Depth-first search over active instances; a grey node reached again is a cycle
  enum class Mark { White, Grey, Black };
  std::vector<Mark> vMarks(vInstances.size(), Mark::White);
  std::vector<std::string> vPath;
  std::function<void(size_t)> visit = [&](size_t nNode) {
    vMarks[nNode] = Mark::Grey;
    vPath.push_back(vInstances[nNode].rr.sName);
    for (const auto& sDep : vInstances[nNode].rr.vDependsOn) {
      const size_t nNext = mActiveNames.at(common::toLowerAscii(sDep));
      if (vMarks[nNext] == Mark::Grey) {
        std::string sCycle;
        auto it = std::find(vPath.begin(), vPath.end(), sDep);
        for (; it != vPath.end(); ++it) sCycle += *it + " -> ";
        throw common::MalformedDocumentError(
            "resources/" + sDep, "Circular resource dependency: " + sCycle + sDep);
      }
      if (vMarks[nNext] == Mark::White) {
        visit(nNext);
      }
    }
    vPath.pop_back();
    vMarks[nNode] = Mark::Black;
  };
  for (size_t i = 0; i < vInstances.size(); ++i) {
    if (vInstances[i].bActive && vMarks[i] == Mark::White) {
      visit(i);
    }
  }
}

}  // namespace

BindOptions BindOptions::fromConfig(const common::Config& cfg) {
  BindOptions bo;
  bo.dcContext.sSubscriptionId = cfg.sSubscriptionId;
  bo.dcContext.sTenantId = cfg.sTenantId;
  bo.dcContext.sResourceGroup = cfg.sResourceGroup;
  bo.dcContext.sLocation = cfg.sLocation;
  bo.dcContext.sDeploymentName = cfg.sDeploymentName;
  bo.dcContext.sMode = cfg.sDeploymentMode;
  bo.iMaxExpressionDepth = cfg.iMaxExpressionDepth;
  bo.bAllowUnknownParameters = cfg.bAllowUnknownParameters;
  return bo;
}

TemplateBinder::TemplateBinder(BindOptions boOptions)
    : _boOptions(std::move(boOptions)), _epParser(_boOptions.iMaxExpressionDepth) {}

TemplateBinder::~TemplateBinder() = default;

void TemplateBinder::validate(const common::Template& tmpl) const {
  // Cycles first: they are reported whatever else is wrong with the values
  VariableEngine ve(tmpl, _epParser);
  ve.validate();

  ExpressionChecker ec(tmpl, _epParser);
  for (const auto& pd : tmpl.vParameters) {
    if (pd.ojDefault.has_value()) {
      ec.check(*pd.ojDefault, "parameters/" + pd.sName + "/defaultValue", true);
    }
  }
  for (const auto& vx : tmpl.vVariables) {
    ec.check(vx.jValue, "variables/" + vx.sName);
  }
  for (size_t i = 0; i < tmpl.vResources.size(); ++i) {
    const auto& rs = tmpl.vResources[i];
    const std::string sBase = "resources/" + std::to_string(i);
    ec.check(rs.sType, sBase + "/type");
    ec.check(rs.sName, sBase + "/name");
    ec.check(rs.sApiVersion, sBase + "/apiVersion");
    if (rs.osLocation) ec.check(*rs.osLocation, sBase + "/location");
    if (rs.ojCondition) ec.check(*rs.ojCondition, sBase + "/condition");
    if (rs.oCopy) ec.check(rs.oCopy->jCount, sBase + "/copy/count");
    ec.check(rs.jProperties, sBase + "/properties");
    ec.check(rs.jExtra, sBase);
    for (size_t j = 0; j < rs.vDependsOn.size(); ++j) {
      ec.check(rs.vDependsOn[j], sBase + "/dependsOn/" + std::to_string(j));
    }
  }
  for (const auto& od : tmpl.vOutputs) {
    ec.check(od.jValue, "outputs/" + od.sName);
  }
}

common::ResolvedTemplate TemplateBinder::bind(const common::Template& tmpl,
                                              const nlohmann::json& jParameterValues) const {
  auto spLog = common::Logger::get();
  spLog->debug("Binding template: {} parameters, {} variables, {} resources, {} outputs",
               tmpl.vParameters.size(), tmpl.vVariables.size(), tmpl.vResources.size(),
               tmpl.vOutputs.size());

  validate(tmpl);

  const auto& dc = _boOptions.dcContext;
  ParameterBinder pb(tmpl, _epParser, _boOptions.bAllowUnknownParameters);
  const auto mParameters = pb.bind(jParameterValues, dc);

  VariableEngine ve(tmpl, _epParser);
  BindingScope scope(tmpl, mParameters, ve, dc);
  ExpressionEvaluator ee(scope, _epParser);

  common::ResolvedTemplate rt;
  rt.sContentVersion = tmpl.sContentVersion;
  rt.mParameters = mParameters;
  for (const auto& pd : tmpl.vParameters) {
    if (common::isSecure(pd.type)) {
      rt.setSecureParameters.insert(pd.sName);
    }
  }

  // ── Variables ──────────────────────────────────────────────────────────
  for (const auto& vx : tmpl.vVariables) {
    scope.variable(vx.sName);
  }
  rt.mVariables = ve.resolvedValues();

  // ── Resources ──────────────────────────────────────────────────────────
  std::vector<ResourceInstance> vInstances;
  for (size_t i = 0; i < tmpl.vResources.size(); ++i) {
    const auto& rs = tmpl.vResources[i];
    const std::string sBase = "resources/" + std::to_string(i);
    if (!rs.oCopy.has_value()) {
      vInstances.push_back(resolveInstance(rs, sBase, ee, dc, rt.vDeferredLocations));
      continue;
    }

    const int64_t iCount = resolveCopyCount(ee, *rs.oCopy, sBase + "/copy/count");
    for (int64_t iIndex = 0; iIndex < iCount; ++iIndex) {
      scope.pushLoop(rs.oCopy->sName, iIndex);
      try {
        vInstances.push_back(resolveInstance(rs, sBase, ee, dc, rt.vDeferredLocations));
      } catch (...) {
        scope.popLoop();
        throw;
      }
      scope.popLoop();
      vInstances.back().sLoopName = rs.oCopy->sName;
    }
  }

  linkDependencies(vInstances);

  size_t nSkipped = 0;
  for (auto& ri : vInstances) {
    if (!ri.bActive) {
      ++nSkipped;
      continue;
    }
    rt.vResourceOrder.push_back(ri.rr.sName);
    rt.mResources.emplace(ri.rr.sName, std::move(ri.rr));
  }

  // ── Outputs ────────────────────────────────────────────────────────────
  for (const auto& od : tmpl.vOutputs) {
    const std::string sLocation = "outputs/" + od.sName;
    nlohmann::json jValue = ee.resolveValue(od.jValue, sLocation, &rt.vDeferredLocations);
    const bool bDeferred =
        !rt.vDeferredLocations.empty() && rt.vDeferredLocations.back() == sLocation;
    if (!bDeferred && !common::matchesType(od.type, jValue)) {
      throw common::ExpressionEvaluationError(
          od.sName, "Output '" + od.sName + "' is declared as " + common::toString(od.type) +
                        " but evaluated to " + jValue.type_name());
    }
    rt.mOutputs[od.sName] = std::move(jValue);
    rt.mOutputTypes[od.sName] = od.type;
  }

  spLog->info("Bound template: {} resources ({} skipped by condition), {} outputs, {} deferred "
              "expressions",
              rt.mResources.size(), nSkipped, rt.mOutputs.size(), rt.vDeferredLocations.size());
  return rt;
}

}  // namespace tpl::core
