#include "common/string_utils.h"

#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace backstop {
class StringUtilsTest : public ::testing::Test {
 protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(StringUtilsTest, SplitString) {
    EXPECT_EQ(SplitString("a,b,c"), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(SplitString("a;b", ';'), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(SplitString("a,,b"), (std::vector<std::string>{"a", "", "b"}));

    // an empty input yields a single empty token
    EXPECT_EQ(SplitString(""), std::vector<std::string>{""});
}

TEST_F(StringUtilsTest, ToUpper) {
    EXPECT_EQ(ToUpper("server_error"), "SERVER_ERROR");
    EXPECT_EQ(ToUpper("Rate_Limited"), "RATE_LIMITED");
    EXPECT_EQ(ToUpper(""), "");
}

TEST_F(StringUtilsTest, TrimCopy) {
    EXPECT_EQ(TrimCopy("  timeout \t\n"), "timeout");
    EXPECT_EQ(TrimCopy("a b"), "a b");
    EXPECT_EQ(TrimCopy("   "), "");
    EXPECT_EQ(TrimCopy(""), "");
}

TEST_F(StringUtilsTest, SplitByCommaTrimsAndDropsEmptyTokens) {
    EXPECT_EQ(SplitByComma(" TIMEOUT , SERVER_ERROR,,"), (std::vector<std::string>{"TIMEOUT", "SERVER_ERROR"}));
    EXPECT_TRUE(SplitByComma("").empty());
    EXPECT_TRUE(SplitByComma(" , ,").empty());
}

TEST_F(StringUtilsTest, SplitByCommaHonorsEscapes) {
    EXPECT_EQ(SplitByComma("a\\,b,c"), (std::vector<std::string>{"a,b", "c"}));
    EXPECT_EQ(SplitByComma("a\\\\,b"), (std::vector<std::string>{"a\\", "b"}));
}

} // namespace backstop
