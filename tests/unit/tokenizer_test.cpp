#include "Tokenizer.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

using nopassplz::ui::cli::Tokenizer;

TEST(TokenizerTest, SplitsOnWhitespace)
{
    EXPECT_THAT(Tokenizer::tokenize("derive 42"), ::testing::ElementsAre("derive", "42"));
    EXPECT_THAT(Tokenizer::tokenize("  list \t 3   "), ::testing::ElementsAre("list", "3"));
}

TEST(TokenizerTest, BlankLineYieldsNoWords)
{
    EXPECT_TRUE(Tokenizer::tokenize("").empty());
    EXPECT_TRUE(Tokenizer::tokenize("   \t").empty());
}

TEST(TokenizerTest, QuotedTitleStaysOneWord)
{
    EXPECT_THAT(Tokenizer::tokenize("label 7 \"Work email\" --description 'old | account'"),
                ::testing::ElementsAre("label", "7", "Work email", "--description", "old | account"));
}

TEST(TokenizerTest, AdjacentQuotedPartsConcatenate)
{
    EXPECT_THAT(Tokenizer::tokenize("ab\"cd\"'ef'"), ::testing::ElementsAre("abcdef"));
}

TEST(TokenizerTest, EmptyQuotesProduceEmptyWord)
{
    EXPECT_THAT(Tokenizer::tokenize("label 1 \"\""), ::testing::ElementsAre("label", "1", ""));
}

TEST(TokenizerTest, BackslashEscapesOutsideQuotes)
{
    EXPECT_THAT(Tokenizer::tokenize("my\\ bank"), ::testing::ElementsAre("my bank"));
    EXPECT_THAT(Tokenizer::tokenize("\\\\"), ::testing::ElementsAre("\\"));
}

TEST(TokenizerTest, DoubleQuotesOnlyUnescapeShellSpecials)
{
    EXPECT_THAT(Tokenizer::tokenize("\"say \\\"hi\\\"\""), ::testing::ElementsAre("say \"hi\""));
    EXPECT_THAT(Tokenizer::tokenize("\"cost\\$5\""), ::testing::ElementsAre("cost$5"));
    EXPECT_THAT(Tokenizer::tokenize("\"C:\\dir\""), ::testing::ElementsAre("C:\\dir"));
}

TEST(TokenizerTest, SingleQuotesAreLiteral)
{
    EXPECT_THAT(Tokenizer::tokenize("'a\\b \"c\"'"), ::testing::ElementsAre("a\\b \"c\""));
}

TEST(TokenizerTest, UnterminatedQuoteKeepsCollectedText)
{
    EXPECT_THAT(Tokenizer::tokenize("\"abc"), ::testing::ElementsAre("abc"));
    EXPECT_THAT(Tokenizer::tokenize("'abc"), ::testing::ElementsAre("abc"));
}

TEST(TokenizerTest, TrailingBackslashIsKept)
{
    EXPECT_THAT(Tokenizer::tokenize("abc\\"), ::testing::ElementsAre("abc\\"));
}
