#include <gtest/gtest.h>

#include <string>

#include "safeprint/utf8.hpp"

using safeprint::is_valid_utf8;
using safeprint::kUnicodeReplacement;
using safeprint::repair_utf8;

TEST(Utf8, ValidInputIsUnchanged)
{
    const std::string text = "plain ascii, \xC3\xA9t\xC3\xA9, \xE2\x82\xAC, \xF0\x9F\x98\x80";
    EXPECT_TRUE(is_valid_utf8(text));
    EXPECT_EQ(repair_utf8(text, " "), text);
}

TEST(Utf8, LoneInvalidByteBecomesOneReplacement)
{
    EXPECT_FALSE(is_valid_utf8("a\xFF" "b"));
    EXPECT_EQ(repair_utf8("a\xFF" "b", " "), "a b");
    EXPECT_EQ(repair_utf8("\x80", "?"), "?");
}

TEST(Utf8, TruncatedSequenceIsOneMaximalSubpart)
{
    // E2 82 은 3바이트 시퀀스의 앞부분 -> replacement 하나
    EXPECT_EQ(repair_utf8("\xE2\x82", "?"), "?");
    EXPECT_EQ(repair_utf8("\xE2\x82" "A", "?"), "?A");
    EXPECT_EQ(repair_utf8("x\xF0\x9F\x98", "?"), "x?");
}

TEST(Utf8, SurrogateAndOverlongBytesAreReplacedIndividually)
{
    EXPECT_EQ(repair_utf8("\xED\xA0\x80", "?"), "???");
    EXPECT_EQ(repair_utf8("\xC0\xAF", "?"), "??");
    EXPECT_EQ(repair_utf8("\xF4\x90\x80\x80", "?"), "????");
}

TEST(Utf8, ExistingReplacementCharacterIsOptional)
{
    const std::string text = std::string("a") + std::string(kUnicodeReplacement) + "b";
    EXPECT_EQ(repair_utf8(text, " "), text);
    EXPECT_EQ(repair_utf8(text, " ", true), "a b");
}

TEST(Utf8, MultiByteReplacementIsAllowed)
{
    EXPECT_EQ(repair_utf8("\xFF", kUnicodeReplacement), std::string(kUnicodeReplacement));
    EXPECT_EQ(repair_utf8("\xFF\xFE", ""), "");
}

TEST(Utf8, EmptyInput)
{
    EXPECT_TRUE(is_valid_utf8(""));
    EXPECT_EQ(repair_utf8("", " "), "");
}
