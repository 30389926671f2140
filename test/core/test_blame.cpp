#include <gtest/gtest.h>

#include "core/Blame.hpp"

using namespace linetrack;

TEST(BlameTest, ParsesHeaderAndAuthor) {
    auto info = Blame::parsePorcelain({"abc123ef 4 10", "author Jane", "author-mail <j@x.com>"});
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->sha, "abc123ef");
    EXPECT_EQ(info->abbrevSha, "abc123ef");
    EXPECT_EQ(info->origLnum, 4);
    EXPECT_EQ(info->finalLnum, 10);
    EXPECT_EQ(info->author, "Jane");
    EXPECT_EQ(info->authorMail, "<j@x.com>");
    EXPECT_FALSE(info->committer.has_value());
}

TEST(BlameTest, ParsesFullLinePorcelain) {
    std::vector<std::string> lines = {
        "3f2a1b0c9d8e7f6a5b4c3d2e1f0a9b8c7d6e5f4a 2 2 1",
        "author Test User",
        "author-mail <test@example.com>",
        "author-time 1700000000",
        "author-tz +0100",
        "committer Other Person",
        "committer-mail <other@example.com>",
        "committer-time 1700000100",
        "committer-tz -0500",
        "summary Fix the thing",
        "previous 0123456789abcdef0123456789abcdef01234567 old/name.txt",
        "filename new/name.txt",
        "\tline content with author spoofing",
    };
    auto info = Blame::parsePorcelain(lines);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->abbrevSha, "3f2a1b0c");
    EXPECT_EQ(info->authorTime, 1700000000);
    EXPECT_EQ(info->authorTz, "+0100");
    EXPECT_EQ(info->committer, "Other Person");
    EXPECT_EQ(info->committerMail, "<other@example.com>");
    EXPECT_EQ(info->committerTime, 1700000100);
    EXPECT_EQ(info->committerTz, "-0500");
    EXPECT_EQ(info->summary, "Fix the thing");
    EXPECT_EQ(info->filename, "new/name.txt");
    EXPECT_EQ(info->previousSha, "0123456789abcdef0123456789abcdef01234567");
    EXPECT_EQ(info->previousFilename, "old/name.txt");
    EXPECT_FALSE(info->boundary);
    EXPECT_TRUE(info->extra.empty());
}

TEST(BlameTest, ContentLinesAreNotFields) {
    auto info = Blame::parsePorcelain({"abc123ef01 1 1 1", "author Real", "\tauthor Fake"});
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->author, "Real");
}

TEST(BlameTest, BoundaryFlagAndUnknownKeys) {
    auto info = Blame::parsePorcelain({"abc123ef01 1 1 1", "boundary", "some-new-key value here"});
    ASSERT_TRUE(info.has_value());
    EXPECT_TRUE(info->boundary);
    ASSERT_EQ(info->extra.count("some_new_key"), 1u);
    EXPECT_EQ(info->extra.at("some_new_key"), "value here");
}

TEST(BlameTest, EmptyOutputIsNoRecord) {
    EXPECT_FALSE(Blame::parsePorcelain({}).has_value());
}

TEST(BlameTest, NotCommittedPlaceholder) {
    BlameInfo info = Blame::notCommitted(7);
    EXPECT_EQ(info.sha, std::string(40, '0'));
    EXPECT_EQ(info.abbrevSha, "00000000");
    EXPECT_EQ(info.origLnum, 7);
    EXPECT_EQ(info.finalLnum, 7);
    EXPECT_EQ(info.author, "Not Committed Yet");
    EXPECT_EQ(info.authorMail, "<not.committed.yet>");
    EXPECT_EQ(info.committer, "Not Committed Yet");
    EXPECT_EQ(info.committerMail, "<not.committed.yet>");
}
