#include <gtest/gtest.h>

#include "util/Version.hpp"

using namespace linetrack;

TEST(VersionTest, ParsesReleaseVersion) {
    Version v = Version::parse("2.30.1");
    EXPECT_EQ(v.major, 2);
    EXPECT_EQ(v.minor, 30);
    EXPECT_EQ(v.patch, 1);
    EXPECT_EQ(v.toString(), "2.30.1");
}

TEST(VersionTest, DevelopmentMarkerMeansPatchZero) {
    Version v = Version::parse("2.20.GIT");
    EXPECT_EQ(v, (Version{2, 20, 0}));
}

TEST(VersionTest, IgnoresVendorSuffix) {
    EXPECT_EQ(Version::parse("2.45.1.windows.1"), (Version{2, 45, 1}));
}

TEST(VersionTest, RejectsMalformedStrings) {
    EXPECT_THROW(Version::parse(""), InvalidVersion);
    EXPECT_THROW(Version::parse("2.30"), InvalidVersion);
    EXPECT_THROW(Version::parse("two.30.1"), InvalidVersion);
    EXPECT_THROW(Version::parse("2.x.1"), InvalidVersion);
    EXPECT_THROW(Version::parse("2.30.1-rc0"), InvalidVersion);
    EXPECT_THROW(Version::parse("2..1"), InvalidVersion);
}

TEST(VersionTest, InvalidVersionIsInvalidArgument) {
    try {
        Version::parse("garbage");
        FAIL() << "expected InvalidVersion";
    } catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("garbage"), std::string::npos);
    }
}

TEST(VersionTest, AtLeastComparesLexicographically) {
    Version v{2, 30, 1};
    EXPECT_TRUE(v.atLeast({2, 13}));
    EXPECT_TRUE(v.atLeast({2, 30, 1}));
    EXPECT_TRUE(v.atLeast({1, 99, 99}));
    EXPECT_FALSE(v.atLeast({2, 30, 2}));
    EXPECT_FALSE(v.atLeast({2, 31}));
    EXPECT_FALSE(v.atLeast({3}));
}

TEST(VersionTest, AtLeastMissingComponentsAreUnconstrained) {
    EXPECT_TRUE((Version{2, 0, 0}).atLeast({2}));
    EXPECT_TRUE((Version{2, 13, 0}).atLeast({2, 13}));
    EXPECT_FALSE((Version{2, 12, 9}).atLeast({2, 13}));
    EXPECT_TRUE((Version{0, 0, 0}).atLeast({}));
}

TEST(VersionTest, ParsedVersionSatisfiesItselfButNotItsSuccessors) {
    for (const char* s : {"0.0.0", "1.9.5", "2.13.0", "2.30.1", "10.2.33", "2.20.GIT"}) {
        Version v = Version::parse(s);
        EXPECT_TRUE(v.atLeast({v.major, v.minor, v.patch})) << s;
        EXPECT_FALSE(v.atLeast({v.major + 1, v.minor, v.patch})) << s;
        EXPECT_FALSE(v.atLeast({v.major, v.minor + 1, v.patch})) << s;
        EXPECT_FALSE(v.atLeast({v.major, v.minor, v.patch + 1})) << s;
    }
}
