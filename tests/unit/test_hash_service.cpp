#include "security/HashService.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

using tpl::security::HashService;

TEST(HashServiceTest, Base64EncodesWithPadding) {
  EXPECT_EQ(HashService::base64Encode("hello"), "aGVsbG8=");
  EXPECT_EQ(HashService::base64Encode(""), "");
}

TEST(HashServiceTest, Base64DecodeRoundTrip) {
  const std::string sInput = "template \x01\x02 binder";
  EXPECT_EQ(HashService::base64Decode(HashService::base64Encode(sInput)), sInput);
}

TEST(HashServiceTest, Base64DecodeRejectsInvalidInput) {
  EXPECT_THROW(HashService::base64Decode("abc"), std::runtime_error);
  EXPECT_THROW(HashService::base64Decode("!!!!"), std::runtime_error);
}

TEST(HashServiceTest, UniqueStringShapeAndStability) {
  const auto sFirst = HashService::uniqueString({"/subscriptions/x/resourceGroups/rg"});
  EXPECT_EQ(sFirst.size(), 13u);
  EXPECT_EQ(sFirst.find_first_not_of("abcdefghijklmnopqrstuvwxyz234567"), std::string::npos);
  EXPECT_EQ(sFirst, HashService::uniqueString({"/subscriptions/x/resourceGroups/rg"}));
  EXPECT_NE(sFirst, HashService::uniqueString({"/subscriptions/x/resourceGroups/rg2"}));
}

TEST(HashServiceTest, DeterministicGuidIsVersion5) {
  const auto sGuid = HashService::deterministicGuid({"a", "b"});
  ASSERT_EQ(sGuid.size(), 36u);
  EXPECT_EQ(sGuid[8], '-');
  EXPECT_EQ(sGuid[13], '-');
  EXPECT_EQ(sGuid[14], '5');
  EXPECT_NE(std::string("89ab").find(sGuid[19]), std::string::npos);
  EXPECT_EQ(sGuid, HashService::deterministicGuid({"a", "b"}));
  EXPECT_NE(sGuid, HashService::deterministicGuid({"a", "c"}));
}
