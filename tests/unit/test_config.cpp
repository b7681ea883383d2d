#include "common/Config.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <string>

using namespace tpl::common;

namespace {

void clearAllTplEnv() {
  const char* vVars[] = {
      "TPL_LOG_LEVEL", "TPL_HTTP_PORT", "TPL_HTTP_THREADS", "TPL_MAX_TEMPLATE_BYTES",
      "TPL_MAX_EXPRESSION_DEPTH", "TPL_ALLOW_UNKNOWN_PARAMETERS", "TPL_SUBSCRIPTION_ID",
      "TPL_TENANT_ID", "TPL_RESOURCE_GROUP", "TPL_LOCATION", "TPL_DEPLOYMENT_NAME",
      "TPL_DEPLOYMENT_MODE",
      nullptr};
  for (int i = 0; vVars[i] != nullptr; ++i) {
    unsetenv(vVars[i]);
  }
}

}  // namespace

class ConfigTest : public ::testing::Test {
 protected:
  void SetUp() override { clearAllTplEnv(); }
  void TearDown() override { clearAllTplEnv(); }
};

TEST_F(ConfigTest, LoadsDefaultsWithEmptyEnvironment) {
  auto cfg = Config::load();
  EXPECT_EQ(cfg.sLogLevel, "info");
  EXPECT_EQ(cfg.iHttpPort, 8080);
  EXPECT_EQ(cfg.iHttpThreads, 4);
  EXPECT_EQ(cfg.iMaxTemplateBytes, 4 * 1024 * 1024);
  EXPECT_EQ(cfg.iMaxExpressionDepth, 64);
  EXPECT_FALSE(cfg.bAllowUnknownParameters);
  EXPECT_EQ(cfg.sSubscriptionId, "00000000-0000-0000-0000-000000000000");
  EXPECT_EQ(cfg.sResourceGroup, "default-rg");
  EXPECT_EQ(cfg.sLocation, "westus");
  EXPECT_EQ(cfg.sDeploymentMode, "Incremental");
}

TEST_F(ConfigTest, OverrideDefaults) {
  setenv("TPL_HTTP_PORT", "9090", 1);
  setenv("TPL_LOG_LEVEL", "debug", 1);
  setenv("TPL_ALLOW_UNKNOWN_PARAMETERS", "true", 1);
  setenv("TPL_RESOURCE_GROUP", "prod-rg", 1);
  setenv("TPL_DEPLOYMENT_MODE", "Complete", 1);

  auto cfg = Config::load();
  EXPECT_EQ(cfg.iHttpPort, 9090);
  EXPECT_EQ(cfg.sLogLevel, "debug");
  EXPECT_TRUE(cfg.bAllowUnknownParameters);
  EXPECT_EQ(cfg.sResourceGroup, "prod-rg");
  EXPECT_EQ(cfg.sDeploymentMode, "Complete");
}

TEST_F(ConfigTest, ThrowsOnNonNumericPort) {
  setenv("TPL_HTTP_PORT", "80abc", 1);
  EXPECT_THROW(Config::load(), std::runtime_error);
}

TEST_F(ConfigTest, ThrowsOnPortOutOfRange) {
  setenv("TPL_HTTP_PORT", "70000", 1);
  EXPECT_THROW(Config::load(), std::runtime_error);
}

TEST_F(ConfigTest, ThrowsOnUnknownLogLevel) {
  setenv("TPL_LOG_LEVEL", "verbose", 1);
  EXPECT_THROW(Config::load(), std::runtime_error);
}

TEST_F(ConfigTest, MaxTemplateBytesHasFloor) {
  setenv("TPL_MAX_TEMPLATE_BYTES", "512", 1);
  EXPECT_THROW(Config::load(), std::runtime_error);
}

TEST_F(ConfigTest, MaxExpressionDepthMustBePositive) {
  setenv("TPL_MAX_EXPRESSION_DEPTH", "0", 1);
  EXPECT_THROW(Config::load(), std::runtime_error);
}

TEST_F(ConfigTest, DeploymentModeMustBeKnown) {
  setenv("TPL_DEPLOYMENT_MODE", "Replace", 1);
  EXPECT_THROW(Config::load(), std::runtime_error);
}
