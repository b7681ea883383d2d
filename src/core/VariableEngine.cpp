#include "core/VariableEngine.hpp"

#include "common/Errors.hpp"
#include "core/ExpressionEvaluator.hpp"

#include <algorithm>
#include <functional>

namespace tpl::core {

namespace {

std::string describeCycle(const std::vector<std::string>& vPath, size_t nStart,
                          const std::string& sClosing) {
  std::string sCycle;
  for (size_t i = nStart; i < vPath.size(); ++i) {
    sCycle += vPath[i] + " -> ";
  }
  return sCycle + sClosing;
}

}  // namespace

VariableEngine::VariableEngine(const common::Template& tmpl, const ExpressionParser& epParser)
    : _tmpl(tmpl), _epParser(epParser) {}

VariableEngine::~VariableEngine() = default;

void VariableEngine::collect(const nlohmann::json& jValue, const std::string& sLocation,
                             std::vector<std::string>& vOut) const {
  if (jValue.is_string()) {
    const auto& sValue = jValue.get_ref<const std::string&>();
    if (!ExpressionParser::isExpression(sValue)) {
      return;
    }
    std::vector<ExprReference> vRefs;
    collectReferences(*_epParser.parse(sValue, sLocation), vRefs);
    for (const auto& ref : vRefs) {
      if (ref.kind == ExprReference::Kind::Variable &&
          std::find(vOut.begin(), vOut.end(), ref.sName) == vOut.end()) {
        vOut.push_back(ref.sName);
      }
    }
  } else if (jValue.is_object()) {
    for (const auto& [sKey, jItem] : jValue.items()) {
      collect(jItem, sLocation + "/" + sKey, vOut);
    }
  } else if (jValue.is_array()) {
    for (size_t i = 0; i < jValue.size(); ++i) {
      collect(jValue[i], sLocation + "/" + std::to_string(i), vOut);
    }
  }
}

std::vector<std::string> VariableEngine::listDependencies(const nlohmann::json& jValue,
                                                          const std::string& sLocation) const {
  std::vector<std::string> vDeps;
  collect(jValue, sLocation, vDeps);
  return vDeps;
}

void VariableEngine::validate() const {
  // Adjacency over lowercase names; edges to undeclared variables are kept aside
  std::map<std::string, std::vector<std::string>> mEdges;
  std::map<std::string, std::string> mDisplayName;
  std::vector<std::pair<std::string, std::string>> vUndeclared;  // (from, to)

  for (const auto& vx : _tmpl.vVariables) {
    const std::string sKey = common::toLowerAscii(vx.sName);
    mDisplayName[sKey] = vx.sName;
    auto& vOut = mEdges[sKey];
    for (const auto& sDep : listDependencies(vx.jValue, "variables/" + vx.sName)) {
      const auto* pTarget = _tmpl.findVariable(sDep);
      if (pTarget == nullptr) {
        vUndeclared.emplace_back(vx.sName, sDep);
      } else {
        vOut.push_back(common::toLowerAscii(pTarget->sName));
      }
    }
  }

  // Depth-first search; a grey node reached again closes a cycle
  enum class Mark { White, Grey, Black };
  std::map<std::string, Mark> mMarks;
  std::vector<std::string> vPath;

  std::function<void(const std::string&)> visit = [&](const std::string& sNode) {
    mMarks[sNode] = Mark::Grey;
    vPath.push_back(mDisplayName[sNode]);
    for (const auto& sNext : mEdges[sNode]) {
      const Mark mark = mMarks[sNext];
      if (mark == Mark::Grey) {
        const auto it = std::find(vPath.begin(), vPath.end(), mDisplayName[sNext]);
        const size_t nStart = static_cast<size_t>(it - vPath.begin());
        throw common::CyclicVariableReferenceError(
            mDisplayName[sNext],
            "Variable reference cycle: " + describeCycle(vPath, nStart, mDisplayName[sNext]));
      }
      if (mark == Mark::White) {
        visit(sNext);
      }
    }
    vPath.pop_back();
    mMarks[sNode] = Mark::Black;
  };

  for (const auto& vx : _tmpl.vVariables) {
    const std::string sKey = common::toLowerAscii(vx.sName);
    if (mMarks[sKey] == Mark::White) {
      visit(sKey);
    }
  }

  if (!vUndeclared.empty()) {
    const auto& [sFrom, sTo] = vUndeclared.front();
    throw common::UnresolvedReferenceError(
        sTo, "Variable '" + sFrom + "' references undeclared variable '" + sTo + "'");
  }
}

nlohmann::json VariableEngine::resolve(const std::string& sName, IEvaluationScope& scope) {
  const auto* pVar = _tmpl.findVariable(sName);
  if (pVar == nullptr) {
    throw common::UnresolvedReferenceError(
        sName, "The template variable '" + sName + "' is not declared");
  }

  const std::string sKey = common::toLowerAscii(pVar->sName);
  if (auto it = _mResolved.find(sKey); it != _mResolved.end()) {
    return it->second;
  }

  if (auto it = std::find(_vInProgress.begin(), _vInProgress.end(), sKey);
      it != _vInProgress.end()) {
    const size_t nStart = static_cast<size_t>(it - _vInProgress.begin());
    throw common::CyclicVariableReferenceError(
        pVar->sName,
        "Variable reference cycle: " + describeCycle(_vInProgress, nStart, sKey));
  }

  _vInProgress.push_back(sKey);
  ExpressionEvaluator ee(scope, _epParser);
  nlohmann::json jValue;
  try {
    jValue = ee.resolveValue(pVar->jValue, "variables/" + pVar->sName);
  } catch (...) {
    _vInProgress.pop_back();
    throw;
  }
  _vInProgress.pop_back();

  _mResolved[sKey] = jValue;
  return jValue;
}

std::map<std::string, nlohmann::json> VariableEngine::resolvedValues() const {
  std::map<std::string, nlohmann::json> mValues;
  for (const auto& vx : _tmpl.vVariables) {
    auto it = _mResolved.find(common::toLowerAscii(vx.sName));
    if (it != _mResolved.end()) {
      mValues[vx.sName] = it->second;
    }
  }
  return mValues;
}

}  // namespace tpl::core
