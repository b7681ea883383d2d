#include "core/DeploymentRequest.hpp"

#include "core/TemplateBinder.hpp"
#include "core/TemplateParser.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace tpl::common;
using namespace tpl::core;
using nlohmann::json;

class DeploymentRequestTest : public ::testing::Test {
 protected:
  void SetUp() override {
    TemplateParser tp;
    auto tmpl = tp.parseFile(std::string(TPL_TEST_FIXTURE_DIR) + "/ubuntu_vm.json");
    _rt = _tbBinder.bind(tmpl, {{"vmName", "box1"}, {"adminPassword", "P@ssw0rd-123"}});
  }

  TemplateBinder _tbBinder;
  ResolvedTemplate _rt;
};

TEST_F(DeploymentRequestTest, BuildsRequestEnvelope) {
  auto jRequest = DeploymentRequest::build(_rt, _tbBinder.options().dcContext);
  const auto& jProps = jRequest["properties"];
  EXPECT_EQ(jProps["mode"], "Incremental");
  EXPECT_EQ(jProps["template"]["$schema"], DeploymentRequest::kSchema);
  EXPECT_EQ(jProps["template"]["contentVersion"], "1.0.0.0");
  EXPECT_EQ(jProps["template"]["outputs"]["nicName"], json({{"type", "string"}, {"value", "box1-nic"}}));
  ASSERT_TRUE(jProps.contains("parameters"));
  EXPECT_EQ(jProps["parameters"], json::object());
}

TEST_F(DeploymentRequestTest, ResidualOutputsStayExpressions) {
  auto jRequest = DeploymentRequest::build(_rt, _tbBinder.options().dcContext);
  EXPECT_EQ(jRequest["properties"]["template"]["outputs"]["privateIp"]["value"],
            "[reference('box1-nic').ipConfigurations[0].properties.privateIPAddress]");
}

TEST(DeploymentRequestEscapeTest, LiteralBracketStringsAreReEscaped) {
  TemplateParser tp;
  TemplateBinder tb;
  auto tmpl = tp.parseDocument(R"({
    "resources": [{
      "type": "Microsoft.Storage/storageAccounts",
      "name": "store1",
      "apiVersion": "2019-06-01",
      "tags": {"note": "[[tagged]"},
      "properties": {
        "note": "[[literal]",
        "built": "[concat('[', 'x', ']')]",
        "plain": "[[abc",
        "key": "[listKeys('store1', '2019-06-01').keys[0].value]"
      }
    }],
    "outputs": {"echo": {"type": "string", "value": "[[out]"}}
  })");
  auto rt = tb.bind(tmpl, json::object());
  EXPECT_EQ(rt.mResources.at("store1").jProperties["note"], "[literal]");

  auto jRequest = DeploymentRequest::build(rt, tb.options().dcContext);
  const auto& jTemplate = jRequest["properties"]["template"];
  const auto& jProps = jTemplate["resources"][0]["properties"];
  EXPECT_EQ(jProps["note"], "[[literal]");
  EXPECT_EQ(jProps["built"], "[[x]");
  EXPECT_EQ(jProps["plain"], "[[abc");
  EXPECT_EQ(jProps["key"], "[listKeys('store1', '2019-06-01').keys[0].value]");
  EXPECT_EQ(jTemplate["resources"][0]["tags"]["note"], "[[tagged]");
  EXPECT_EQ(jTemplate["outputs"]["echo"]["value"], "[[out]");

  // The rendered template binds back to the same literal values
  auto rtAgain = tb.bind(tp.parse(jTemplate), json::object());
  const auto& jPropsAgain = rtAgain.mResources.at("store1").jProperties;
  EXPECT_EQ(jPropsAgain["note"], "[literal]");
  EXPECT_EQ(jPropsAgain["built"], "[x]");
  EXPECT_EQ(jPropsAgain["plain"], "[[abc");
  EXPECT_EQ(rtAgain.mOutputs.at("echo"), "[out]");
}

TEST_F(DeploymentRequestTest, ResourcesKeepOrderAndUseResourceIdsForDependencies) {
  auto jResources = DeploymentRequest::resourcesToJson(_rt);
  ASSERT_EQ(jResources.size(), 3u);
  EXPECT_EQ(jResources[0]["name"], "box1-vnet");
  EXPECT_FALSE(jResources[0].contains("dependsOn"));
  EXPECT_EQ(jResources[2]["name"], "box1");
  EXPECT_EQ(jResources[2]["location"], "westus");
  EXPECT_EQ(jResources[2]["tags"]["displayName"], "BOX1");
  EXPECT_EQ(jResources[2]["dependsOn"],
            json::array({"/subscriptions/00000000-0000-0000-0000-000000000000/resourceGroups/"
                         "default-rg/providers/Microsoft.Network/networkInterfaces/box1-nic"}));
}

TEST_F(DeploymentRequestTest, RedactsSecureParameters) {
  auto jParams = DeploymentRequest::redactParameters(_rt);
  EXPECT_EQ(jParams["adminPassword"], "***");
  EXPECT_EQ(jParams["vmName"], "box1");
  EXPECT_EQ(jParams["ubuntuOSVersion"], "16.04.0-LTS");
}
