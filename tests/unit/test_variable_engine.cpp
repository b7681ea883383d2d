#include "core/VariableEngine.hpp"

#include "common/Errors.hpp"
#include "core/TemplateParser.hpp"
#include "FakeScope.hpp"

#include <gtest/gtest.h>

using namespace tpl::common;
using namespace tpl::core;
using nlohmann::json;

namespace {

Template templateWithVariables(const json& jVariables) {
  TemplateParser tp;
  return tp.parse(json{{"variables", jVariables}, {"resources", json::array()}});
}

}  // namespace

class VariableEngineTest : public ::testing::Test {
 protected:
  ExpressionParser _epParser;
  tpl::test::FakeScope _scope;
};

TEST_F(VariableEngineTest, ListsDependenciesInOrderWithoutDuplicates) {
  auto tmpl = templateWithVariables({{"a", "x"}});
  VariableEngine ve(tmpl, _epParser);
  json jValue = {{"first", "[concat(variables('b'), variables('c'))]"},
                 {"second", json::array({"[variables('b')]", "[parameters('p')]"})}};
  EXPECT_EQ(ve.listDependencies(jValue, "test"), (std::vector<std::string>{"b", "c"}));
}

TEST_F(VariableEngineTest, ValidateAcceptsAcyclicGraph) {
  auto tmpl = templateWithVariables({{"a", "[variables('b')]"}, {"b", "[variables('c')]"}, {"c", 1}});
  VariableEngine ve(tmpl, _epParser);
  EXPECT_NO_THROW(ve.validate());
}

TEST_F(VariableEngineTest, ValidateReportsCycle) {
  auto tmpl = templateWithVariables({{"a", "[variables('b')]"},
                                     {"b", {{"nested", "[variables('c')]"}}},
                                     {"c", "[concat(variables('A'), 'x')]"}});
  VariableEngine ve(tmpl, _epParser);
  try {
    ve.validate();
    FAIL() << "expected CyclicVariableReferenceError";
  } catch (const CyclicVariableReferenceError& e) {
    EXPECT_EQ(std::string(e.what()), "Variable reference cycle: a -> b -> c -> a");
  }
}

TEST_F(VariableEngineTest, ValidateReportsSelfReference) {
  auto tmpl = templateWithVariables({{"loop", "[variables('loop')]"}});
  VariableEngine ve(tmpl, _epParser);
  EXPECT_THROW(ve.validate(), CyclicVariableReferenceError);
}

TEST_F(VariableEngineTest, CycleIsReportedBeforeUndeclaredReference) {
  auto tmpl = templateWithVariables({{"a", "[variables('missing')]"},
                                     {"b", "[variables('c')]"},
                                     {"c", "[variables('b')]"}});
  VariableEngine ve(tmpl, _epParser);
  EXPECT_THROW(ve.validate(), CyclicVariableReferenceError);
}

TEST_F(VariableEngineTest, ValidateReportsUndeclaredVariable) {
  auto tmpl = templateWithVariables({{"a", "[variables('missing')]"}});
  VariableEngine ve(tmpl, _epParser);
  EXPECT_THROW(ve.validate(), UnresolvedReferenceError);
}

TEST_F(VariableEngineTest, ResolveMemoizesAndKeysByDeclaredName) {
  auto tmpl = templateWithVariables({{"Prefix", "[toLower('WEB')]"}, {"n", 3}});
  VariableEngine ve(tmpl, _epParser);
  EXPECT_EQ(ve.resolve("prefix", _scope), "web");
  EXPECT_EQ(ve.resolve("PREFIX", _scope), "web");
  auto mValues = ve.resolvedValues();
  ASSERT_EQ(mValues.size(), 1u);
  EXPECT_EQ(mValues.at("Prefix"), "web");
}

TEST_F(VariableEngineTest, ResolveRejectsUndeclaredName) {
  auto tmpl = templateWithVariables({{"a", 1}});
  VariableEngine ve(tmpl, _epParser);
  EXPECT_THROW(ve.resolve("b", _scope), UnresolvedReferenceError);
}
