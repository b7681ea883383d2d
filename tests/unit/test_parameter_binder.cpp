#include "core/ParameterBinder.hpp"

#include "common/Errors.hpp"
#include "core/TemplateParser.hpp"

#include <gtest/gtest.h>

using namespace tpl::common;
using namespace tpl::core;
using nlohmann::json;

namespace {

Template templateWithParameters(const json& jParameters) {
  TemplateParser tp;
  return tp.parse(json{{"parameters", jParameters}, {"resources", json::array()}});
}

const json kOsParameter = {
    {"ubuntuOSVersion",
     {{"type", "string"},
      {"defaultValue", "16.04.0-LTS"},
      {"allowedValues", json::array({"12.04.5-LTS", "14.04.5-LTS", "15.10", "16.04.0-LTS"})}}}};

}  // namespace

class ParameterBinderTest : public ::testing::Test {
 protected:
  std::map<std::string, json> bind(const Template& tmpl, const json& jSupplied,
                                   bool bAllowUnknown = false) {
    ParameterBinder pb(tmpl, _epParser, bAllowUnknown);
    return pb.bind(jSupplied, _dc);
  }

  ExpressionParser _epParser;
  DeploymentContext _dc;
};

TEST_F(ParameterBinderTest, DefaultAppliesWhenNotSupplied) {
  auto tmpl = templateWithParameters(kOsParameter);
  EXPECT_EQ(bind(tmpl, json::object()).at("ubuntuOSVersion"), "16.04.0-LTS");
}

TEST_F(ParameterBinderTest, AllowedValueIsAccepted) {
  auto tmpl = templateWithParameters(kOsParameter);
  EXPECT_EQ(bind(tmpl, {{"ubuntuOSVersion", "15.10"}}).at("ubuntuOSVersion"), "15.10");
}

TEST_F(ParameterBinderTest, ValueOutsideAllowedSetIsRejected) {
  auto tmpl = templateWithParameters(kOsParameter);
  try {
    bind(tmpl, {{"ubuntuOSVersion", "18.04"}});
    FAIL() << "expected InvalidParameterValueError";
  } catch (const InvalidParameterValueError& e) {
    EXPECT_EQ(e._sName, "ubuntuOSVersion");
    EXPECT_NE(std::string(e.what()).find("18.04"), std::string::npos);
  }
}

TEST_F(ParameterBinderTest, MissingRequiredParameter) {
  auto tmpl = templateWithParameters({{"vmName", {{"type", "string"}}}});
  EXPECT_THROW(bind(tmpl, json::object()), MissingParameterError);
}

TEST_F(ParameterBinderTest, TypeMismatchIsRejected) {
  auto tmpl = templateWithParameters({{"count", {{"type", "int"}}}});
  EXPECT_THROW(bind(tmpl, {{"count", "3"}}), InvalidParameterValueError);
  EXPECT_EQ(bind(tmpl, {{"count", 3}}).at("count"), 3);
}

TEST_F(ParameterBinderTest, BoundsAreEnforced) {
  auto tmpl = templateWithParameters(
      {{"count", {{"type", "int"}, {"minValue", 1}, {"maxValue", 5}}},
       {"name", {{"type", "string"}, {"minLength", 3}, {"maxLength", 5}, {"defaultValue", "abcd"}}}});
  EXPECT_THROW(bind(tmpl, {{"count", 0}}), InvalidParameterValueError);
  EXPECT_THROW(bind(tmpl, {{"count", 6}}), InvalidParameterValueError);
  EXPECT_THROW(bind(tmpl, {{"count", 2}, {"name", "ab"}}), InvalidParameterValueError);
  EXPECT_THROW(bind(tmpl, {{"count", 2}, {"name", "abcdef"}}), InvalidParameterValueError);
  EXPECT_NO_THROW(bind(tmpl, {{"count", 5}}));
}

TEST_F(ParameterBinderTest, ArrayElementsCheckedAgainstAllowedValues) {
  auto tmpl = templateWithParameters(
      {{"zones", {{"type", "array"}, {"allowedValues", json::array({"1", "2", "3"})}}}});
  EXPECT_NO_THROW(bind(tmpl, {{"zones", json::array({"1", "3"})}}));
  EXPECT_THROW(bind(tmpl, {{"zones", json::array({"4"})}}), InvalidParameterValueError);
}

TEST_F(ParameterBinderTest, SecureValueIsNotEchoedInError) {
  auto tmpl = templateWithParameters(
      {{"password", {{"type", "securestring"}, {"allowedValues", json::array({"a"})}}}});
  try {
    bind(tmpl, {{"password", "hunter2"}});
    FAIL() << "expected InvalidParameterValueError";
  } catch (const InvalidParameterValueError& e) {
    EXPECT_EQ(std::string(e.what()).find("hunter2"), std::string::npos);
  }
}

TEST_F(ParameterBinderTest, UndeclaredSuppliedParameterIsRejected) {
  auto tmpl = templateWithParameters(kOsParameter);
  EXPECT_THROW(bind(tmpl, {{"extra", 1}}), InvalidParameterValueError);
  EXPECT_NO_THROW(bind(tmpl, {{"extra", 1}}, true));
}

TEST_F(ParameterBinderTest, DuplicateSpellingsAreRejected) {
  auto tmpl = templateWithParameters(kOsParameter);
  EXPECT_THROW(bind(tmpl, {{"ubuntuOSVersion", "15.10"}, {"UBUNTUOSVERSION", "15.10"}}),
               InvalidParameterValueError);
}

TEST_F(ParameterBinderTest, DefaultsMayReferenceOtherParameters) {
  auto tmpl = templateWithParameters(
      {{"prefix", {{"type", "string"}}},
       {"storageName", {{"type", "string"}, {"defaultValue", "[concat(parameters('prefix'), 'stg')]"}}},
       {"location", {{"type", "string"}, {"defaultValue", "[resourceGroup().location]"}}}});
  auto mBound = bind(tmpl, {{"prefix", "web"}});
  EXPECT_EQ(mBound.at("storageName"), "webstg");
  EXPECT_EQ(mBound.at("location"), "westus");
}

TEST_F(ParameterBinderTest, DefaultReferencingItselfIsCyclic) {
  auto tmpl = templateWithParameters(
      {{"a", {{"type", "string"}, {"defaultValue", "[parameters('b')]"}}},
       {"b", {{"type", "string"}, {"defaultValue", "[parameters('a')]"}}}});
  EXPECT_THROW(bind(tmpl, json::object()), CyclicVariableReferenceError);
}

TEST_F(ParameterBinderTest, DefaultMustMatchDeclaredType) {
  auto tmpl = templateWithParameters({{"n", {{"type", "int"}, {"defaultValue", "five"}}}});
  EXPECT_THROW(bind(tmpl, json::object()), InvalidParameterValueError);
}

TEST_F(ParameterBinderTest, CoercesCommandLineText) {
  ParameterDeclaration pd;
  pd.sName = "n";
  pd.type = ParameterType::Int;
  EXPECT_EQ(ParameterBinder::coerceFromText(pd, "42"), 42);
  EXPECT_THROW(ParameterBinder::coerceFromText(pd, "4x"), InvalidParameterValueError);

  pd.type = ParameterType::Bool;
  EXPECT_EQ(ParameterBinder::coerceFromText(pd, "True"), true);

  pd.type = ParameterType::Array;
  EXPECT_EQ(ParameterBinder::coerceFromText(pd, "[1, 2]"), json::array({1, 2}));

  pd.type = ParameterType::String;
  EXPECT_EQ(ParameterBinder::coerceFromText(pd, "42"), "42");
}
