#include "core/FunctionLibrary.hpp"

#include "common/Errors.hpp"
#include "common/Types.hpp"
#include "security/HashService.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace tpl::core {

namespace {

using json = nlohmann::json;
using Args = std::vector<json>;

constexpr size_t kVariadic = std::numeric_limits<size_t>::max();
constexpr int64_t kMaxRangeCount = 10000;
constexpr int64_t kMaxPadLength = 16384;

[[noreturn]] void fail(const FunctionCall& fc, const std::string& sReason) {
  throw common::ExpressionEvaluationError(fc.sLocation,
                                          "Function '" + fc.sFunction + "': " + sReason);
}

int64_t checkedAdd(const FunctionCall& fc, int64_t iLhs, int64_t iRhs) {
  int64_t iResult = 0;
  if (__builtin_add_overflow(iLhs, iRhs, &iResult)) fail(fc, "integer overflow");
  return iResult;
}

int64_t checkedSub(const FunctionCall& fc, int64_t iLhs, int64_t iRhs) {
  int64_t iResult = 0;
  if (__builtin_sub_overflow(iLhs, iRhs, &iResult)) fail(fc, "integer overflow");
  return iResult;
}

int64_t checkedMul(const FunctionCall& fc, int64_t iLhs, int64_t iRhs) {
  int64_t iResult = 0;
  if (__builtin_mul_overflow(iLhs, iRhs, &iResult)) fail(fc, "integer overflow");
  return iResult;
}

void requireArgs(const FunctionCall& fc, const Args& vArgs, size_t nMin, size_t nMax) {
  if (vArgs.size() < nMin || vArgs.size() > nMax) {
    std::string sExpected = std::to_string(nMin);
    if (nMax == kVariadic) {
      sExpected = "at least " + sExpected;
    } else if (nMax != nMin) {
      sExpected += ".." + std::to_string(nMax);
    }
    fail(fc, "expects " + sExpected + " argument(s), got " + std::to_string(vArgs.size()));
  }
}

const char* typeName(const json& jValue) {
  if (jValue.is_string()) return "string";
  if (jValue.is_number_integer()) return "int";
  if (jValue.is_boolean()) return "bool";
  if (jValue.is_array()) return "array";
  if (jValue.is_object()) return "object";
  if (jValue.is_null()) return "null";
  return "number";
}

void requireType(const FunctionCall& fc, const Args& vArgs, size_t i, bool bOk,
                 const char* pExpected) {
  if (!bOk) {
    fail(fc, "argument " + std::to_string(i + 1) + " must be " + pExpected + ", got " +
                 typeName(vArgs[i]));
  }
}

const std::string& asString(const FunctionCall& fc, const Args& vArgs, size_t i) {
  requireType(fc, vArgs, i, vArgs[i].is_string(), "a string");
  return vArgs[i].get_ref<const std::string&>();
}

int64_t asInt(const FunctionCall& fc, const Args& vArgs, size_t i) {
  requireType(fc, vArgs, i, vArgs[i].is_number_integer(), "an int");
  return vArgs[i].get<int64_t>();
}

bool asBool(const FunctionCall& fc, const Args& vArgs, size_t i) {
  requireType(fc, vArgs, i, vArgs[i].is_boolean(), "a bool");
  return vArgs[i].get<bool>();
}

/// String form used when scalars are spliced into text.
std::string display(const json& jValue) {
  if (jValue.is_string()) return jValue.get<std::string>();
  if (jValue.is_null()) return "";
  return jValue.dump();
}

std::vector<std::string> splitString(const std::string& sValue, char cDelim) {
  std::vector<std::string> vParts;
  size_t nStart = 0;
  for (;;) {
    const size_t nPos = sValue.find(cDelim, nStart);
    vParts.push_back(sValue.substr(nStart, nPos - nStart));
    if (nPos == std::string::npos) break;
    nStart = nPos + 1;
  }
  return vParts;
}

std::string buildProviderPath(const FunctionCall& fc, const Args& vArgs, size_t nTypeIdx) {
  const std::string& sType = asString(fc, vArgs, nTypeIdx);
  const auto vSegments = splitString(sType, '/');
  const bool bValid = vSegments.size() >= 2 &&
                      std::none_of(vSegments.begin(), vSegments.end(),
                                   [](const std::string& s) { return s.empty(); });
  if (!bValid) {
    fail(fc, "invalid resource type '" + sType + "'");
  }
  const size_t nNames = vArgs.size() - nTypeIdx - 1;
  if (nNames != vSegments.size() - 1) {
    fail(fc, "resource type '" + sType + "' requires " + std::to_string(vSegments.size() - 1) +
                 " name segment(s), got " + std::to_string(nNames));
  }
  std::string sPath = "/providers/" + vSegments[0];
  for (size_t i = 1; i < vSegments.size(); ++i) {
    sPath += "/" + vSegments[i] + "/" + asString(fc, vArgs, nTypeIdx + i);
  }
  return sPath;
}

size_t findTypeArgument(const FunctionCall& fc, const Args& vArgs, size_t nMaxIdx) {
  for (size_t i = 0; i < vArgs.size(); ++i) {
    if (asString(fc, vArgs, i).find('/') != std::string::npos) {
      if (i > nMaxIdx) {
        fail(fc, "too many scope arguments before the resource type");
      }
      return i;
    }
  }
  fail(fc, "no resource type argument (expected 'Namespace/type')");
}

size_t ifind(const std::string& sHaystack, const std::string& sNeedle, bool bLast) {
  const std::string sH = common::toLowerAscii(sHaystack);
  const std::string sN = common::toLowerAscii(sNeedle);
  return bLast ? sH.rfind(sN) : sH.find(sN);
}

int compareValues(const FunctionCall& fc, const Args& vArgs) {
  if (vArgs[0].is_number_integer() && vArgs[1].is_number_integer()) {
    const auto i0 = vArgs[0].get<int64_t>();
    const auto i1 = vArgs[1].get<int64_t>();
    return i0 < i1 ? -1 : (i0 > i1 ? 1 : 0);
  }
  if (vArgs[0].is_string() && vArgs[1].is_string()) {
    return vArgs[0].get_ref<const std::string&>().compare(vArgs[1].get_ref<const std::string&>());
  }
  fail(fc, std::string("cannot compare ") + typeName(vArgs[0]) + " with " + typeName(vArgs[1]));
}

std::vector<int64_t> numericOperands(const FunctionCall& fc, const Args& vArgs) {
  std::vector<int64_t> vValues;
  if (vArgs.size() == 1 && vArgs[0].is_array()) {
    for (const auto& jItem : vArgs[0]) {
      if (!jItem.is_number_integer()) {
        fail(fc, "array elements must be ints");
      }
      vValues.push_back(jItem.get<int64_t>());
    }
  } else {
    for (size_t i = 0; i < vArgs.size(); ++i) {
      vValues.push_back(asInt(fc, vArgs, i));
    }
  }
  if (vValues.empty()) {
    fail(fc, "requires at least one value");
  }
  return vValues;
}

}  // namespace

// ── Construction ───────────────────────────────────────────────────────────

const FunctionLibrary& FunctionLibrary::instance() {
  static const FunctionLibrary flInstance;
  return flInstance;
}

FunctionLibrary::FunctionLibrary() {
  registerScopeFunctions();
  registerDeploymentFunctions();
  registerStringFunctions();
  registerCollectionFunctions();
  registerLogicalFunctions();
  registerNumericFunctions();
}

bool FunctionLibrary::isRuntimeFunction(const std::string& sName) {
  const std::string sLower = common::toLowerAscii(sName);
  return sLower == "reference" || (sLower.size() > 4 && sLower.compare(0, 4, "list") == 0);
}

bool FunctionLibrary::contains(const std::string& sName) const {
  const std::string sLower = common::toLowerAscii(sName);
  return _mFunctions.count(sLower) > 0 || sLower == "if" || isRuntimeFunction(sLower);
}

json FunctionLibrary::call(const std::string& sName, const Args& vArgs, IEvaluationScope& scope,
                           const std::string& sLocation) const {
  auto it = _mFunctions.find(common::toLowerAscii(sName));
  if (it == _mFunctions.end()) {
    throw common::MalformedDocumentError(sLocation.empty() ? sName : sLocation,
                                         "Unknown template function '" + sName + "'");
  }
  const FunctionCall fc{sName, sLocation, scope};
  return it->second(vArgs, fc);
}

// ── Scope ──────────────────────────────────────────────────────────────────

void FunctionLibrary::registerScopeFunctions() {
  _mFunctions["parameters"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 1, 1);
    return fc.scope.parameter(asString(fc, vArgs, 0));
  };

  _mFunctions["variables"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 1, 1);
    return fc.scope.variable(asString(fc, vArgs, 0));
  };

  // copyIndex(), copyIndex(offset), copyIndex('loop'), copyIndex('loop', offset)
  _mFunctions["copyindex"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 0, 2);
    std::string sLoop;
    int64_t iOffset = 0;
    if (!vArgs.empty()) {
      if (vArgs[0].is_string()) {
        sLoop = vArgs[0].get<std::string>();
        if (vArgs.size() == 2) iOffset = asInt(fc, vArgs, 1);
      } else {
        if (vArgs.size() == 2) fail(fc, "expects (loopName, offset)");
        iOffset = asInt(fc, vArgs, 0);
      }
    }
    const auto oiIndex = fc.scope.copyIndex(sLoop);
    if (!oiIndex) {
      fail(fc, sLoop.empty() ? "used outside of a copy loop"
                             : "no enclosing copy loop named '" + sLoop + "'");
    }
    return checkedAdd(fc, *oiIndex, iOffset);
  };
}

// ── Deployment ─────────────────────────────────────────────────────────────

std::string FunctionLibrary::resourceIdFor(const common::DeploymentContext& dc,
                                           const std::string& sType, const std::string& sName) {
  const auto vSegments = splitString(sType, '/');
  const auto vNames = splitString(sName, '/');
  if (vSegments.size() < 2 || vNames.size() != vSegments.size() - 1) {
    return {};
  }
  std::string sId = "/subscriptions/" + dc.sSubscriptionId + "/resourceGroups/" +
                    dc.sResourceGroup + "/providers/" + vSegments[0];
  for (size_t i = 1; i < vSegments.size(); ++i) {
    sId += "/" + vSegments[i] + "/" + vNames[i - 1];
  }
  return sId;
}

void FunctionLibrary::registerDeploymentFunctions() {
  _mFunctions["resourcegroup"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 0, 0);
    const auto& dc = fc.scope.context();
    return json{
        {"id", "/subscriptions/" + dc.sSubscriptionId + "/resourceGroups/" + dc.sResourceGroup},
        {"name", dc.sResourceGroup},
        {"type", "Microsoft.Resources/resourceGroups"},
        {"location", dc.sLocation},
        {"properties", {{"provisioningState", "Succeeded"}}}};
  };

  _mFunctions["subscription"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 0, 0);
    const auto& dc = fc.scope.context();
    return json{{"id", "/subscriptions/" + dc.sSubscriptionId},
                {"subscriptionId", dc.sSubscriptionId},
                {"tenantId", dc.sTenantId},
                {"displayName", dc.sSubscriptionId}};
  };

  _mFunctions["deployment"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 0, 0);
    const auto& dc = fc.scope.context();
    return json{{"name", dc.sDeploymentName}, {"properties", {{"mode", dc.sMode}}}};
  };

  // resourceId([subscriptionId], [resourceGroupName], type, name1, name2, ...)
  _mFunctions["resourceid"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 2, kVariadic);
    const size_t nTypeIdx = findTypeArgument(fc, vArgs, 2);
    const auto& dc = fc.scope.context();
    std::string sSub = dc.sSubscriptionId;
    std::string sRg = dc.sResourceGroup;
    if (nTypeIdx == 1) {
      sRg = vArgs[0].get<std::string>();
    } else if (nTypeIdx == 2) {
      sSub = vArgs[0].get<std::string>();
      sRg = vArgs[1].get<std::string>();
    }
    return "/subscriptions/" + sSub + "/resourceGroups/" + sRg +
           buildProviderPath(fc, vArgs, nTypeIdx);
  };

  // subscriptionResourceId([subscriptionId], type, name1, ...)
  _mFunctions["subscriptionresourceid"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 2, kVariadic);
    const size_t nTypeIdx = findTypeArgument(fc, vArgs, 1);
    std::string sSub = fc.scope.context().sSubscriptionId;
    if (nTypeIdx == 1) {
      sSub = vArgs[0].get<std::string>();
    }
    return "/subscriptions/" + sSub + buildProviderPath(fc, vArgs, nTypeIdx);
  };
}

// ── Strings ────────────────────────────────────────────────────────────────

void FunctionLibrary::registerStringFunctions() {
  _mFunctions["concat"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 1, kVariadic);
    if (vArgs[0].is_array()) {
      json jResult = json::array();
      for (size_t i = 0; i < vArgs.size(); ++i) {
        requireType(fc, vArgs, i, vArgs[i].is_array(), "an array");
        jResult.insert(jResult.end(), vArgs[i].begin(), vArgs[i].end());
      }
      return jResult;
    }
    std::string sResult;
    for (size_t i = 0; i < vArgs.size(); ++i) {
      requireType(fc, vArgs, i, vArgs[i].is_primitive(), "a string or scalar");
      sResult += display(vArgs[i]);
    }
    return sResult;
  };

  // format('{0}-{1}', a, b); '{{' and '}}' are literal braces
  _mFunctions["format"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 1, kVariadic);
    const std::string& sFmt = asString(fc, vArgs, 0);
    std::string sOut;
    for (size_t i = 0; i < sFmt.size(); ++i) {
      const char c = sFmt[i];
      if (c == '{') {
        if (i + 1 < sFmt.size() && sFmt[i + 1] == '{') {
          sOut += '{';
          ++i;
          continue;
        }
        const size_t nClose = sFmt.find('}', i);
        if (nClose == std::string::npos) {
          fail(fc, "unterminated placeholder in format string");
        }
        std::string sSpec = sFmt.substr(i + 1, nClose - i - 1);
        sSpec = sSpec.substr(0, sSpec.find(':'));
        size_t nIndex = 0;
        try {
          size_t nConsumed = 0;
          nIndex = std::stoul(sSpec, &nConsumed);
          if (nConsumed != sSpec.size()) throw std::invalid_argument(sSpec);
        } catch (const std::logic_error&) {
          fail(fc, "invalid placeholder '{" + sSpec + "}'");
        }
        if (nIndex + 1 >= vArgs.size()) {
          fail(fc, "placeholder {" + std::to_string(nIndex) + "} has no matching argument");
        }
        sOut += display(vArgs[nIndex + 1]);
        i = nClose;
      } else if (c == '}') {
        if (i + 1 < sFmt.size() && sFmt[i + 1] == '}') {
          sOut += '}';
          ++i;
          continue;
        }
        fail(fc, "unbalanced '}' in format string");
      } else {
        sOut += c;
      }
    }
    return sOut;
  };

  _mFunctions["tolower"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 1, 1);
    return common::toLowerAscii(asString(fc, vArgs, 0));
  };

  _mFunctions["toupper"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 1, 1);
    std::string sValue = asString(fc, vArgs, 0);
    std::transform(sValue.begin(), sValue.end(), sValue.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return sValue;
  };

  _mFunctions["trim"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 1, 1);
    const std::string& sValue = asString(fc, vArgs, 0);
    const size_t nStart = sValue.find_first_not_of(" \t\r\n");
    if (nStart == std::string::npos) return "";
    const size_t nEnd = sValue.find_last_not_of(" \t\r\n");
    return sValue.substr(nStart, nEnd - nStart + 1);
  };

  _mFunctions["replace"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 3, 3);
    std::string sValue = asString(fc, vArgs, 0);
    const std::string& sOld = asString(fc, vArgs, 1);
    const std::string& sNew = asString(fc, vArgs, 2);
    if (sOld.empty()) {
      fail(fc, "the string to replace must not be empty");
    }
    size_t nPos = 0;
    while ((nPos = sValue.find(sOld, nPos)) != std::string::npos) {
      sValue.replace(nPos, sOld.size(), sNew);
      nPos += sNew.size();
    }
    return sValue;
  };

  _mFunctions["substring"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 2, 3);
    const std::string& sValue = asString(fc, vArgs, 0);
    const int64_t iStart = asInt(fc, vArgs, 1);
    const int64_t iSize = static_cast<int64_t>(sValue.size());
    const int64_t iLen = vArgs.size() == 3 ? asInt(fc, vArgs, 2) : iSize - iStart;
    if (iStart < 0 || iLen < 0 || iStart > iSize || iLen > iSize - iStart) {
      fail(fc, "range [" + std::to_string(iStart) + ", +" + std::to_string(iLen) +
                   ") is outside a string of length " + std::to_string(iSize));
    }
    return sValue.substr(static_cast<size_t>(iStart), static_cast<size_t>(iLen));
  };

  _mFunctions["indexof"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 2, 2);
    const size_t nPos = ifind(asString(fc, vArgs, 0), asString(fc, vArgs, 1), false);
    return nPos == std::string::npos ? int64_t{-1} : static_cast<int64_t>(nPos);
  };

  _mFunctions["lastindexof"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 2, 2);
    const size_t nPos = ifind(asString(fc, vArgs, 0), asString(fc, vArgs, 1), true);
    return nPos == std::string::npos ? int64_t{-1} : static_cast<int64_t>(nPos);
  };

  _mFunctions["startswith"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 2, 2);
    const std::string sValue = common::toLowerAscii(asString(fc, vArgs, 0));
    const std::string sPrefix = common::toLowerAscii(asString(fc, vArgs, 1));
    return sValue.compare(0, sPrefix.size(), sPrefix) == 0;
  };

  _mFunctions["endswith"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 2, 2);
    const std::string sValue = common::toLowerAscii(asString(fc, vArgs, 0));
    const std::string sSuffix = common::toLowerAscii(asString(fc, vArgs, 1));
    return sValue.size() >= sSuffix.size() &&
           sValue.compare(sValue.size() - sSuffix.size(), sSuffix.size(), sSuffix) == 0;
  };

  // split(value, delimiter) or split(value, [delimiters])
  _mFunctions["split"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 2, 2);
    const std::string& sValue = asString(fc, vArgs, 0);
    std::vector<std::string> vDelims;
    if (vArgs[1].is_array()) {
      for (const auto& jDelim : vArgs[1]) {
        if (!jDelim.is_string()) fail(fc, "delimiters must be strings");
        vDelims.push_back(jDelim.get<std::string>());
      }
    } else {
      vDelims.push_back(asString(fc, vArgs, 1));
    }
    if (vDelims.empty() || std::any_of(vDelims.begin(), vDelims.end(),
                                       [](const std::string& s) { return s.empty(); })) {
      fail(fc, "delimiters must not be empty");
    }

    json jParts = json::array();
    size_t nStart = 0;
    for (;;) {
      size_t nBest = std::string::npos;
      size_t nBestLen = 0;
      for (const auto& sDelim : vDelims) {
        const size_t nPos = sValue.find(sDelim, nStart);
        if (nPos < nBest) {
          nBest = nPos;
          nBestLen = sDelim.size();
        }
      }
      jParts.push_back(sValue.substr(nStart, nBest - nStart));
      if (nBest == std::string::npos) break;
      nStart = nBest + nBestLen;
    }
    return jParts;
  };

  _mFunctions["join"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 2, 2);
    requireType(fc, vArgs, 0, vArgs[0].is_array(), "an array");
    const std::string& sDelim = asString(fc, vArgs, 1);
    std::string sOut;
    bool bFirst = true;
    for (const auto& jItem : vArgs[0]) {
      if (!jItem.is_primitive()) fail(fc, "array elements must be scalars");
      if (!bFirst) sOut += sDelim;
      sOut += display(jItem);
      bFirst = false;
    }
    return sOut;
  };

  _mFunctions["padleft"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 2, 3);
    requireType(fc, vArgs, 0, vArgs[0].is_string() || vArgs[0].is_number_integer(),
                "a string or int");
    std::string sValue = display(vArgs[0]);
    const int64_t iTotal = asInt(fc, vArgs, 1);
    char cPad = ' ';
    if (vArgs.size() == 3) {
      const std::string& sPad = asString(fc, vArgs, 2);
      if (sPad.size() != 1) fail(fc, "padding character must be a single character");
      cPad = sPad[0];
    }
    if (iTotal > kMaxPadLength) {
      fail(fc, "total length must not exceed " + std::to_string(kMaxPadLength));
    }
    if (iTotal > static_cast<int64_t>(sValue.size())) {
      sValue.insert(0, static_cast<size_t>(iTotal) - sValue.size(), cPad);
    }
    return sValue;
  };

  _mFunctions["string"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 1, 1);
    return vArgs[0].is_string() ? vArgs[0] : json(vArgs[0].dump());
  };

  _mFunctions["uniquestring"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 1, kVariadic);
    std::vector<std::string> vParts;
    for (size_t i = 0; i < vArgs.size(); ++i) {
      vParts.push_back(asString(fc, vArgs, i));
    }
    return security::HashService::uniqueString(vParts);
  };

  _mFunctions["guid"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 1, kVariadic);
    std::vector<std::string> vParts;
    for (size_t i = 0; i < vArgs.size(); ++i) {
      vParts.push_back(asString(fc, vArgs, i));
    }
    return security::HashService::deterministicGuid(vParts);
  };

  _mFunctions["base64"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 1, 1);
    return security::HashService::base64Encode(asString(fc, vArgs, 0));
  };

  _mFunctions["base64tostring"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 1, 1);
    const std::string& sEncoded = asString(fc, vArgs, 0);
    try {
      return security::HashService::base64Decode(sEncoded);
    } catch (const std::runtime_error& ex) {
      fail(fc, ex.what());
    }
  };
}

// ── Collections ────────────────────────────────────────────────────────────

void FunctionLibrary::registerCollectionFunctions() {
  _mFunctions["length"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 1, 1);
    if (vArgs[0].is_string()) {
      return static_cast<int64_t>(vArgs[0].get_ref<const std::string&>().size());
    }
    requireType(fc, vArgs, 0, vArgs[0].is_array() || vArgs[0].is_object(),
                "a string, array or object");
    return static_cast<int64_t>(vArgs[0].size());
  };

  _mFunctions["empty"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 1, 1);
    if (vArgs[0].is_null()) return true;
    if (vArgs[0].is_string()) return vArgs[0].get_ref<const std::string&>().empty();
    requireType(fc, vArgs, 0, vArgs[0].is_array() || vArgs[0].is_object(),
                "a string, array or object");
    return vArgs[0].empty();
  };

  _mFunctions["contains"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 2, 2);
    const json& jContainer = vArgs[0];
    if (jContainer.is_string()) {
      return jContainer.get_ref<const std::string&>().find(display(vArgs[1])) !=
             std::string::npos;
    }
    if (jContainer.is_array()) {
      return std::find(jContainer.begin(), jContainer.end(), vArgs[1]) != jContainer.end();
    }
    if (jContainer.is_object()) {
      const std::string sKey = common::toLowerAscii(asString(fc, vArgs, 1));
      for (const auto& [sItemKey, jItem] : jContainer.items()) {
        if (common::toLowerAscii(sItemKey) == sKey) return true;
      }
      return false;
    }
    fail(fc, std::string("argument 1 must be a string, array or object, got ") +
                 typeName(jContainer));
  };

  _mFunctions["createarray"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 0, kVariadic);
    return json(vArgs);
  };

  _mFunctions["createobject"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 0, kVariadic);
    if (vArgs.size() % 2 != 0) {
      fail(fc, "expects key/value pairs");
    }
    json jObject = json::object();
    for (size_t i = 0; i < vArgs.size(); i += 2) {
      jObject[asString(fc, vArgs, i)] = vArgs[i + 1];
    }
    return jObject;
  };

  _mFunctions["first"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 1, 1);
    if (vArgs[0].is_string()) {
      const auto& sValue = vArgs[0].get_ref<const std::string&>();
      return sValue.empty() ? std::string{} : sValue.substr(0, 1);
    }
    requireType(fc, vArgs, 0, vArgs[0].is_array(), "a string or array");
    return vArgs[0].empty() ? json(nullptr) : vArgs[0].front();
  };

  _mFunctions["last"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 1, 1);
    if (vArgs[0].is_string()) {
      const auto& sValue = vArgs[0].get_ref<const std::string&>();
      return sValue.empty() ? std::string{} : sValue.substr(sValue.size() - 1);
    }
    requireType(fc, vArgs, 0, vArgs[0].is_array(), "a string or array");
    return vArgs[0].empty() ? json(nullptr) : vArgs[0].back();
  };

  _mFunctions["take"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 2, 2);
    const int64_t iCount = asInt(fc, vArgs, 1);
    if (vArgs[0].is_string()) {
      const auto& sValue = vArgs[0].get_ref<const std::string&>();
      const size_t n = static_cast<size_t>(std::clamp<int64_t>(
          iCount, 0, static_cast<int64_t>(sValue.size())));
      return sValue.substr(0, n);
    }
    requireType(fc, vArgs, 0, vArgs[0].is_array(), "a string or array");
    const auto n = std::clamp<int64_t>(iCount, 0, static_cast<int64_t>(vArgs[0].size()));
    return json(std::vector<json>(vArgs[0].begin(), vArgs[0].begin() + n));
  };

  _mFunctions["skip"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 2, 2);
    const int64_t iCount = asInt(fc, vArgs, 1);
    if (vArgs[0].is_string()) {
      const auto& sValue = vArgs[0].get_ref<const std::string&>();
      const size_t n = static_cast<size_t>(std::clamp<int64_t>(
          iCount, 0, static_cast<int64_t>(sValue.size())));
      return sValue.substr(n);
    }
    requireType(fc, vArgs, 0, vArgs[0].is_array(), "a string or array");
    const auto n = std::clamp<int64_t>(iCount, 0, static_cast<int64_t>(vArgs[0].size()));
    return json(std::vector<json>(vArgs[0].begin() + n, vArgs[0].end()));
  };

  _mFunctions["range"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 2, 2);
    const int64_t iStart = asInt(fc, vArgs, 0);
    const int64_t iCount = asInt(fc, vArgs, 1);
    if (iCount < 0 || iCount > kMaxRangeCount) {
      fail(fc, "count must be in 0.." + std::to_string(kMaxRangeCount));
    }
    json jResult = json::array();
    if (iCount > 0) checkedAdd(fc, iStart, iCount - 1);
    for (int64_t i = 0; i < iCount; ++i) {
      jResult.push_back(iStart + i);
    }
    return jResult;
  };

  // union of objects (later keys win) or of arrays (first occurrence kept)
  _mFunctions["union"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 1, kVariadic);
    if (vArgs[0].is_object()) {
      json jResult = json::object();
      for (size_t i = 0; i < vArgs.size(); ++i) {
        requireType(fc, vArgs, i, vArgs[i].is_object(), "an object");
        for (const auto& [sKey, jValue] : vArgs[i].items()) {
          jResult[sKey] = jValue;
        }
      }
      return jResult;
    }
    json jResult = json::array();
    for (size_t i = 0; i < vArgs.size(); ++i) {
      requireType(fc, vArgs, i, vArgs[i].is_array(), "an array");
      for (const auto& jItem : vArgs[i]) {
        if (std::find(jResult.begin(), jResult.end(), jItem) == jResult.end()) {
          jResult.push_back(jItem);
        }
      }
    }
    return jResult;
  };

  _mFunctions["array"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 1, 1);
    return vArgs[0].is_array() ? vArgs[0] : json::array({vArgs[0]});
  };

  _mFunctions["json"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 1, 1);
    try {
      return json::parse(asString(fc, vArgs, 0));
    } catch (const json::parse_error& ex) {
      fail(fc, std::string("invalid JSON: ") + ex.what());
    }
  };

  _mFunctions["coalesce"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 1, kVariadic);
    for (const auto& jValue : vArgs) {
      if (!jValue.is_null()) return jValue;
    }
    return nullptr;
  };
}

// ── Logical / comparison ───────────────────────────────────────────────────

void FunctionLibrary::registerLogicalFunctions() {
  _mFunctions["equals"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 2, 2);
    return vArgs[0] == vArgs[1];
  };

  _mFunctions["not"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 1, 1);
    return !asBool(fc, vArgs, 0);
  };

  _mFunctions["and"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 2, kVariadic);
    bool bResult = true;
    for (size_t i = 0; i < vArgs.size(); ++i) {
      bResult = asBool(fc, vArgs, i) && bResult;
    }
    return bResult;
  };

  _mFunctions["or"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 2, kVariadic);
    bool bResult = false;
    for (size_t i = 0; i < vArgs.size(); ++i) {
      bResult = asBool(fc, vArgs, i) || bResult;
    }
    return bResult;
  };

  _mFunctions["bool"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 1, 1);
    if (vArgs[0].is_boolean()) return vArgs[0];
    if (vArgs[0].is_number_integer()) return vArgs[0].get<int64_t>() != 0;
    const std::string sValue = common::toLowerAscii(asString(fc, vArgs, 0));
    if (sValue == "true") return true;
    if (sValue == "false") return false;
    fail(fc, "cannot convert '" + sValue + "' to bool");
  };

  _mFunctions["true"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 0, 0);
    return true;
  };

  _mFunctions["false"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 0, 0);
    return false;
  };

  _mFunctions["null"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 0, 0);
    return nullptr;
  };

  _mFunctions["less"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 2, 2);
    return compareValues(fc, vArgs) < 0;
  };

  _mFunctions["lessorequals"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 2, 2);
    return compareValues(fc, vArgs) <= 0;
  };

  _mFunctions["greater"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 2, 2);
    return compareValues(fc, vArgs) > 0;
  };

  _mFunctions["greaterorequals"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 2, 2);
    return compareValues(fc, vArgs) >= 0;
  };
}

// ── Numeric ────────────────────────────────────────────────────────────────

void FunctionLibrary::registerNumericFunctions() {
  _mFunctions["int"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 1, 1);
    if (vArgs[0].is_number_integer()) return vArgs[0];
    const std::string& sValue = asString(fc, vArgs, 0);
    try {
      size_t nConsumed = 0;
      const int64_t iValue = std::stoll(sValue, &nConsumed);
      if (nConsumed == sValue.size()) return iValue;
    } catch (const std::logic_error&) {
      // fall through to the error below
    }
    fail(fc, "cannot convert '" + sValue + "' to int");
  };

  _mFunctions["add"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 2, 2);
    return checkedAdd(fc, asInt(fc, vArgs, 0), asInt(fc, vArgs, 1));
  };

  _mFunctions["sub"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 2, 2);
    return checkedSub(fc, asInt(fc, vArgs, 0), asInt(fc, vArgs, 1));
  };

  _mFunctions["mul"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 2, 2);
    return checkedMul(fc, asInt(fc, vArgs, 0), asInt(fc, vArgs, 1));
  };

  _mFunctions["div"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 2, 2);
    const int64_t iDivisor = asInt(fc, vArgs, 1);
    if (iDivisor == 0) fail(fc, "division by zero");
    const int64_t iDividend = asInt(fc, vArgs, 0);
    if (iDividend == std::numeric_limits<int64_t>::min() && iDivisor == -1) {
      fail(fc, "integer overflow");
    }
    return iDividend / iDivisor;
  };

  _mFunctions["mod"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 2, 2);
    const int64_t iDivisor = asInt(fc, vArgs, 1);
    if (iDivisor == 0) fail(fc, "division by zero");
    const int64_t iDividend = asInt(fc, vArgs, 0);
    if (iDividend == std::numeric_limits<int64_t>::min() && iDivisor == -1) {
      fail(fc, "integer overflow");
    }
    return iDividend % iDivisor;
  };

  _mFunctions["min"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 1, kVariadic);
    const auto vValues = numericOperands(fc, vArgs);
    return *std::min_element(vValues.begin(), vValues.end());
  };

  _mFunctions["max"] = [](const Args& vArgs, const FunctionCall& fc) -> json {
    requireArgs(fc, vArgs, 1, kVariadic);
    const auto vValues = numericOperands(fc, vArgs);
    return *std::max_element(vValues.begin(), vValues.end());
  };
}

}  // namespace tpl::core
