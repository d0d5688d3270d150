#include <gtest/gtest.h>
#include "utils/string_utils.hpp"

using namespace livetranslate::utils;

TEST(StringUtilsTest, Trim) {
    EXPECT_EQ(trim("  hello world \n"), "hello world");
    EXPECT_EQ(trim("\t\r\n "), "");
    EXPECT_EQ(trim(""), "");
    EXPECT_EQ(trim("x"), "x");
}

TEST(StringUtilsTest, ToLowerAsciiLeavesUtf8Alone) {
    EXPECT_EQ(toLowerAscii("BONJOUR"), "bonjour");
    EXPECT_EQ(toLowerAscii("Tr\xC3\xA8S"), "tr\xC3\xA8s");
}

TEST(StringUtilsTest, Utf8CompleteLengthAscii) {
    EXPECT_EQ(utf8CompleteLength(""), 0u);
    EXPECT_EQ(utf8CompleteLength("hello"), 5u);
}

TEST(StringUtilsTest, Utf8CompleteLengthFullSequences) {
    EXPECT_EQ(utf8CompleteLength("tr\xC3\xA8"), 4u);
    EXPECT_EQ(utf8CompleteLength("\xE2\x82\xAC"), 3u);
    EXPECT_EQ(utf8CompleteLength("a\xF0\x9F\x98\x80"), 5u);
}

TEST(StringUtilsTest, Utf8CompleteLengthCutsPartialTail) {
    EXPECT_EQ(utf8CompleteLength("tr\xC3"), 2u);
    EXPECT_EQ(utf8CompleteLength("ab\xE2\x82"), 2u);
    EXPECT_EQ(utf8CompleteLength("a\xF0\x9F\x98"), 1u);
}

TEST(StringUtilsTest, TrimRemovesNoBreakSpaces) {
    EXPECT_EQ(trim("\xC2\xA0" "Bonjour\xC2\xA0"), "Bonjour");
    EXPECT_EQ(trim("\xE2\x80\xAF \xC2\xA0"), "");
    EXPECT_EQ(trim("caf\xC3\xA9"), "caf\xC3\xA9");
}

TEST(StringUtilsTest, SplitWordsOnAnyWhitespace) {
    EXPECT_EQ(splitWords("  Bonjour\xC2\xA0!\tle\nmonde "),
              (std::vector<std::string>{"Bonjour", "!", "le", "monde"}));
    EXPECT_EQ(splitWords("Merci\xE2\x80\xAF?"), (std::vector<std::string>{"Merci", "?"}));
    EXPECT_TRUE(splitWords(" \xC2\xA0 ").empty());
}
