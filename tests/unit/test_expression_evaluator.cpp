#include "core/ExpressionEvaluator.hpp"

#include "common/Errors.hpp"
#include "FakeScope.hpp"

#include <gtest/gtest.h>

using namespace tpl::common;
using namespace tpl::core;
using nlohmann::json;

class ExpressionEvaluatorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    _scope.mParameters["vmName"] = "box1";
    _scope.mParameters["useIp"] = false;
    _scope.mVariables["settings"] = {{"Tier", "Standard"}, {"zones", json::array({"1", "2"})}};
  }

  json resolve(const json& jValue, std::vector<std::string>* pvDeferred = nullptr) {
    ExpressionEvaluator ee(_scope, _epParser);
    return ee.resolveValue(jValue, "test", pvDeferred);
  }

  tpl::test::FakeScope _scope;
  ExpressionParser _epParser;
};

TEST_F(ExpressionEvaluatorTest, EvaluatesNestedCalls) {
  EXPECT_EQ(resolve("[concat(parameters('vmName'), '-nic')]"), "box1-nic");
  EXPECT_EQ(resolve("[toUpper(substring(parameters('vmName'), 0, 3))]"), "BOX");
}

TEST_F(ExpressionEvaluatorTest, MemberAccessIgnoresCase) {
  EXPECT_EQ(resolve("[variables('settings').tier]"), "Standard");
  EXPECT_EQ(resolve("[variables('settings')['ZONES'][1]]"), "2");
}

TEST_F(ExpressionEvaluatorTest, MissingMemberFails) {
  EXPECT_THROW(resolve("[variables('settings').sku]"), ExpressionEvaluationError);
  EXPECT_THROW(resolve("[variables('settings').zones[5]]"), ExpressionEvaluationError);
}

TEST_F(ExpressionEvaluatorTest, IfEvaluatesOnlySelectedBranch) {
  EXPECT_EQ(resolve("[if(parameters('useIp'), div(1, 0), 'none')]"), "none");
  EXPECT_THROW(resolve("[if('yes', 1, 2)]"), ExpressionEvaluationError);
}

TEST_F(ExpressionEvaluatorTest, ResolvesObjectsAndArraysElementWise) {
  json jValue = {{"name", "[parameters('vmName')]"},
                 {"tags", json::array({"[[raw]", "[toLower('A')]"})},
                 {"count", 2}};
  EXPECT_EQ(resolve(jValue), json({{"name", "box1"}, {"tags", json::array({"[raw]", "a"})},
                                   {"count", 2}}));
}

TEST_F(ExpressionEvaluatorTest, ResidualReferenceIsRewrittenWithFoldedArguments) {
  std::vector<std::string> vDeferred;
  json jValue = {{"ip", "[reference(concat(parameters('vmName'), '-pip')).ipAddress]"}};
  auto jResult = resolve(jValue, &vDeferred);
  EXPECT_EQ(jResult["ip"], "[reference('box1-pip').ipAddress]");
  EXPECT_EQ(vDeferred, std::vector<std::string>{"test/ip"});
}

TEST_F(ExpressionEvaluatorTest, ResidualPropagatesThroughEnclosingCalls) {
  std::vector<std::string> vDeferred;
  auto jResult = resolve("[concat('key=', listKeys('stg', '2019-06-01').keys[0].value)]",
                         &vDeferred);
  EXPECT_EQ(jResult, "[concat('key=', listKeys('stg', '2019-06-01').keys[0].value)]");
  EXPECT_EQ(vDeferred.size(), 1u);
}

TEST_F(ExpressionEvaluatorTest, ResidualIsRejectedInStrictContext) {
  EXPECT_THROW(resolve("[reference('nic').ipAddress]"), ExpressionEvaluationError);
}

TEST_F(ExpressionEvaluatorTest, UndeclaredReferencePropagates) {
  EXPECT_THROW(resolve("[parameters('missing')]"), UnresolvedReferenceError);
}
