#include <gtest/gtest.h>
#include <managers/pattern_list.hpp>

static PatternList compile(const std::vector<std::string>& patterns) {
    auto r = PatternList::compile(patterns);
    EXPECT_TRUE(r.is_ok()) << r.error;
    return r.value;
}

TEST(PatternList, EmptyMatchesNothing) {
    PatternList list;
    EXPECT_TRUE(list.empty());
    EXPECT_FALSE(list.matches("anything"));
}

TEST(PatternList, StarMatchesWholeName) {
    auto list = compile({"*.fits"});
    EXPECT_TRUE(list.matches("cube.fits"));
    EXPECT_TRUE(list.matches(".fits"));
    EXPECT_FALSE(list.matches("cube.fits.tmp"));
    EXPECT_FALSE(list.matches("cubefits"));
}

TEST(PatternList, QuestionMarkAndClasses) {
    auto list = compile({"cube00?.fits", "raw[0-9].dat", "tmp[!a].x"});
    EXPECT_TRUE(list.matches("cube001.fits"));
    EXPECT_FALSE(list.matches("cube0010.fits"));
    EXPECT_TRUE(list.matches("raw7.dat"));
    EXPECT_FALSE(list.matches("rawx.dat"));
    EXPECT_TRUE(list.matches("tmpb.x"));
    EXPECT_FALSE(list.matches("tmpa.x"));
}

TEST(PatternList, RegexMetacharactersAreLiteral) {
    auto list = compile({"a+b(1).txt", "*:Zone.Identifier"});
    EXPECT_TRUE(list.matches("a+b(1).txt"));
    EXPECT_FALSE(list.matches("aab1.txt"));
    EXPECT_TRUE(list.matches("x.fits:Zone.Identifier"));
    EXPECT_FALSE(list.matches("x.fits:ZoneXIdentifier"));
}

TEST(PatternList, NegationReincludes) {
    auto list = compile({"*.tmp", "!keep.tmp"});
    EXPECT_TRUE(list.matches("scratch.tmp"));
    EXPECT_FALSE(list.matches("keep.tmp"));
}

TEST(PatternList, LaterPatternsOverride) {
    auto list = compile({"!keep.tmp", "*.tmp"});
    EXPECT_TRUE(list.matches("keep.tmp"));
}

TEST(PatternList, CommentsAndBlanksSkipped) {
    auto list = compile({"# comment", "", "   ", "*.log"});
    EXPECT_EQ(list.size(), 1u);
    EXPECT_TRUE(list.matches("run.log"));
}

TEST(PatternList, EscapedStar) {
    auto list = compile({"a\\*b"});
    EXPECT_TRUE(list.matches("a*b"));
    EXPECT_FALSE(list.matches("axxb"));
}

TEST(PatternList, UnclosedClassIsAnError) {
    auto r = PatternList::compile({"data[0-9"});
    EXPECT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("data[0-9"), std::string::npos);
}
