#include <gtest/gtest.h>

#include "util/StringUtils.hpp"

using namespace linetrack;

TEST(StringUtilsTest, SplitKeepsEmptyFields) {
    EXPECT_EQ(StringUtils::split("a\t\tb", '\t'), (std::vector<std::string>{"a", "", "b"}));
    EXPECT_EQ(StringUtils::split("", ','), (std::vector<std::string>{""}));
    EXPECT_EQ(StringUtils::split("a,", ','), (std::vector<std::string>{"a", ""}));
}

TEST(StringUtilsTest, SplitWhitespaceCollapsesRuns) {
    EXPECT_EQ(StringUtils::splitWhitespace("  i/lf    w/crlf attr/  "),
              (std::vector<std::string>{"i/lf", "w/crlf", "attr/"}));
    EXPECT_TRUE(StringUtils::splitWhitespace("   ").empty());
}

TEST(StringUtilsTest, StartsWithAndTrim) {
    EXPECT_TRUE(StringUtils::startsWith("@@ -1 +1 @@", "@@"));
    EXPECT_FALSE(StringUtils::startsWith("@", "@@"));
    EXPECT_EQ(StringUtils::trim("\t fatal: bad\r\n"), "fatal: bad");
    EXPECT_EQ(StringUtils::trim(" \n"), "");
}
