#include "core/TemplateParser.hpp"

#include "common/Errors.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace tpl::common;
using namespace tpl::core;
using nlohmann::json;

class TemplateParserTest : public ::testing::Test {
 protected:
  Template parse(const std::string& sDocument) { return _tpParser.parseDocument(sDocument); }

  TemplateParser _tpParser;
};

TEST_F(TemplateParserTest, ParsesUbuntuFixture) {
  auto tmpl = _tpParser.parseFile(std::string(TPL_TEST_FIXTURE_DIR) + "/ubuntu_vm.json");
  EXPECT_EQ(tmpl.sContentVersion, "1.0.0.0");
  EXPECT_EQ(tmpl.vParameters.size(), 5u);
  EXPECT_EQ(tmpl.vResources.size(), 3u);
  EXPECT_EQ(tmpl.vOutputs.size(), 2u);

  const auto* pOs = tmpl.findParameter("UBUNTUOSVERSION");
  ASSERT_NE(pOs, nullptr);
  EXPECT_EQ(pOs->type, ParameterType::String);
  EXPECT_FALSE(pOs->isRequired());
  ASSERT_TRUE(pOs->ovAllowedValues.has_value());
  EXPECT_EQ(pOs->ovAllowedValues->size(), 4u);

  const auto* pPassword = tmpl.findParameter("adminPassword");
  ASSERT_NE(pPassword, nullptr);
  EXPECT_EQ(pPassword->type, ParameterType::SecureString);
  EXPECT_EQ(pPassword->oiMinLength, std::optional<int64_t>(8));

  const auto* pVmName = tmpl.findParameter("vmName");
  ASSERT_NE(pVmName, nullptr);
  EXPECT_TRUE(pVmName->isRequired());
  EXPECT_EQ(pVmName->osDescription, std::optional<std::string>("Name of the virtual machine."));

  const auto& rsVm = tmpl.vResources[2];
  EXPECT_EQ(rsVm.sType, "Microsoft.Compute/virtualMachines");
  EXPECT_EQ(rsVm.vDependsOn.size(), 1u);
  EXPECT_TRUE(rsVm.jExtra.contains("tags"));
}

TEST_F(TemplateParserTest, DefaultsContentVersion) {
  auto tmpl = parse(R"({"resources": []})");
  EXPECT_EQ(tmpl.sContentVersion, "1.0.0.0");
  EXPECT_TRUE(tmpl.vParameters.empty());
}

TEST_F(TemplateParserTest, ParsesCopyAndCondition) {
  auto tmpl = parse(R"({
    "resources": [
      {"type": "Microsoft.Storage/storageAccounts", "apiVersion": "2019-06-01",
       "name": "[concat('stg', copyIndex())]", "condition": true,
       "copy": {"name": "loop", "count": "[parameters('n')]"}}
    ]
  })");
  const auto& rs = tmpl.vResources[0];
  ASSERT_TRUE(rs.oCopy.has_value());
  EXPECT_EQ(rs.oCopy->sName, "loop");
  EXPECT_EQ(rs.oCopy->jCount, "[parameters('n')]");
  EXPECT_EQ(rs.ojCondition, std::optional<json>(true));
}

TEST_F(TemplateParserTest, RejectsInvalidJson) {
  EXPECT_THROW(_tpParser.parseDocument("{\"resources\": ["), MalformedDocumentError);
}

TEST_F(TemplateParserTest, RequiresResources) {
  EXPECT_THROW(parse(R"({"parameters": {}})"), MalformedDocumentError);
}

TEST_F(TemplateParserTest, RejectsUnknownParameterType) {
  try {
    parse(R"({"parameters": {"x": {"type": "float"}}, "resources": []})");
    FAIL() << "expected MalformedDocumentError";
  } catch (const MalformedDocumentError& e) {
    EXPECT_EQ(e._sName, "parameters/x/type");
  }
}

TEST_F(TemplateParserTest, RejectsResourceWithoutName) {
  EXPECT_THROW(parse(R"({"resources": [{"type": "A/b", "apiVersion": "1"}]})"),
               MalformedDocumentError);
}

TEST_F(TemplateParserTest, RejectsNestedResources) {
  EXPECT_THROW(parse(R"({"resources": [
      {"type": "A/b", "name": "x", "apiVersion": "1", "resources": []}]})"),
               MalformedDocumentError);
}

TEST_F(TemplateParserTest, RejectsDuplicateNamesIgnoringCase) {
  EXPECT_THROW(parse(R"({"variables": {"name": 1, "NAME": 2}, "resources": []})"),
               MalformedDocumentError);
}

TEST_F(TemplateParserTest, RejectsOutputWithoutValue) {
  EXPECT_THROW(parse(R"({"resources": [], "outputs": {"o": {"type": "string"}}})"),
               MalformedDocumentError);
}

TEST_F(TemplateParserTest, EnforcesSizeLimit) {
  TemplateParser tpSmall(16);
  EXPECT_THROW(tpSmall.parseDocument(R"({"resources": [], "variables": {}})"),
               MalformedDocumentError);
}

TEST_F(TemplateParserTest, MissingFileIsMalformed) {
  EXPECT_THROW(_tpParser.parseFile("/nonexistent/template.json"), MalformedDocumentError);
}

// ── Parameter values ───────────────────────────────────────────────────────

TEST_F(TemplateParserTest, AcceptsPlainParameterObject) {
  json jValues = {{"vmName", "box1"}, {"count", 2}};
  EXPECT_EQ(TemplateParser::parseParameterValues(jValues), jValues);
}

TEST_F(TemplateParserTest, UnwrapsParametersFile) {
  json jFile = json::parse(R"({
    "$schema": "https://schema.management.azure.com/schemas/2015-01-01/deploymentParameters.json#",
    "contentVersion": "1.0.0.0",
    "parameters": {"vmName": {"value": "box1"}, "count": {"value": 2}}
  })");
  EXPECT_EQ(TemplateParser::parseParameterValues(jFile), json({{"vmName", "box1"}, {"count", 2}}));
}

TEST_F(TemplateParserTest, RejectsKeyVaultReference) {
  json jFile = json::parse(R"({
    "contentVersion": "1.0.0.0",
    "parameters": {"secret": {"reference": {"keyVault": {"id": "kv"}, "secretName": "s"}}}
  })");
  EXPECT_THROW(TemplateParser::parseParameterValues(jFile), MalformedDocumentError);
}
