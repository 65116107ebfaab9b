#include <gtest/gtest.h>

#include <boost/algorithm/string/join.hpp>

#include "tokenizer.hpp"

namespace nbayes {

TEST(TokenizerTest, EmptyInput) {
  EXPECT_TRUE(Tokenizer::Tokenize("").empty());
}

TEST(TokenizerTest, WhitespaceAndPunctuationOnly) {
  EXPECT_TRUE(Tokenizer::Tokenize("   \t\n ").empty());
  EXPECT_TRUE(Tokenizer::Tokenize("!?.,;:-_()'\"").empty());
  EXPECT_TRUE(Tokenizer::Tokenize(" ... !!! ").empty());
}

TEST(TokenizerTest, LowercasesAndDropsPunctuation) {
  TokenVec expected;
  expected.push_back("hello");
  expected.push_back("world");
  EXPECT_EQ(expected, Tokenizer::Tokenize("Hello, World!"));
}

TEST(TokenizerTest, PunctuationSeparatesWords) {
  TokenVec expected;
  expected.push_back("a");
  expected.push_back("b");
  EXPECT_EQ(expected, Tokenizer::Tokenize("a--b"));
  EXPECT_EQ(expected, Tokenizer::Tokenize("a_b"));
}

TEST(TokenizerTest, KeepsDigitsAndOrder) {
  TokenVec expected;
  expected.push_back("make");
  expected.push_back("america");
  expected.push_back("great");
  expected.push_back("2016");
  expected.push_back("great");
  EXPECT_EQ(expected,
      Tokenizer::Tokenize("  #MAKE America GREAT 2016...great  "));
}

TEST(TokenizerTest, KeepsNonAsciiBytesInsideWords) {
  TokenVec tokens = Tokenizer::Tokenize("Caf\xc3\xa9 ol\xc3\xa9!");
  ASSERT_EQ(2u, tokens.size());
  EXPECT_EQ("caf\xc3\xa9", tokens[0]);
  EXPECT_EQ("ol\xc3\xa9", tokens[1]);
}

TEST(TokenizerTest, UnicodePunctuationEndsWords) {
  TokenVec great;
  great.push_back("great");
  // trailing ellipsis of a truncated tweet
  EXPECT_EQ(great, Tokenizer::Tokenize("great\xe2\x80\xa6"));
  EXPECT_EQ(great, Tokenizer::Tokenize("\xe2\x80\x9cGreat\xe2\x80\x9d"));

  TokenVec hello_world;
  hello_world.push_back("hello");
  hello_world.push_back("world");
  // no-break space
  EXPECT_EQ(hello_world, Tokenizer::Tokenize("hello\xc2\xa0world"));
  // ideographic comma
  EXPECT_EQ(hello_world, Tokenizer::Tokenize("hello\xe3\x80\x81world"));

  // right single quotation mark splits like an ASCII apostrophe
  EXPECT_EQ(Tokenizer::Tokenize("I'm"),
      Tokenizer::Tokenize("I\xe2\x80\x99m"));
}

TEST(TokenizerTest, MalformedUtf8StaysInsideWord) {
  TokenVec tokens = Tokenizer::Tokenize("ab\xff\xc3" "cd ef");
  ASSERT_EQ(2u, tokens.size());
  EXPECT_EQ("ab\xff\xc3" "cd", tokens[0]);
  EXPECT_EQ("ef", tokens[1]);
}

TEST(TokenizerTest, AppendsToExistingTokens) {
  TokenVec tokens;
  tokens.push_back("first");
  Tokenizer::Tokenize("Second THIRD", &tokens);
  ASSERT_EQ(3u, tokens.size());
  EXPECT_EQ("first", tokens[0]);
  EXPECT_EQ("second", tokens[1]);
  EXPECT_EQ("third", tokens[2]);
}

TEST(TokenizerTest, Idempotent) {
  const char* texts[] = {
    "Hello, World!",
    "a--b",
    "RT @realDonaldTrump: We will #MAGA!!! http://t.co/xyz",
    "I'm with her. #ImWithHer",
    "Crooked Hillary\xe2\x80\xa6 caf\xc3\xa9\xc2\xa0ol\xc3\xa9",
    "",
  };
  for (const char* text : texts) {
    const TokenVec once = Tokenizer::Tokenize(text);
    const TokenVec twice
        = Tokenizer::Tokenize(boost::algorithm::join(once, " "));
    EXPECT_EQ(once, twice) << text;
  }
}

TEST(TokenizerTest, WordChars) {
  EXPECT_TRUE(Tokenizer::IsWordChar('a'));
  EXPECT_TRUE(Tokenizer::IsWordChar('Z'));
  EXPECT_TRUE(Tokenizer::IsWordChar('7'));
  EXPECT_TRUE(Tokenizer::IsWordChar('_'));
  EXPECT_TRUE(Tokenizer::IsWordChar(0xc3));
  EXPECT_FALSE(Tokenizer::IsWordChar(' '));
  EXPECT_FALSE(Tokenizer::IsWordChar('-'));
}

TEST(TokenizerTest, SeparatorCodePoints) {
  EXPECT_TRUE(Tokenizer::IsSeparatorCodePoint(0xa0));
  EXPECT_TRUE(Tokenizer::IsSeparatorCodePoint(0x2019));
  EXPECT_TRUE(Tokenizer::IsSeparatorCodePoint(0x2026));
  EXPECT_TRUE(Tokenizer::IsSeparatorCodePoint(0x3000));
  EXPECT_FALSE(Tokenizer::IsSeparatorCodePoint(0xe9));
  EXPECT_FALSE(Tokenizer::IsSeparatorCodePoint(0x4e2d));
}

}  // namespace nbayes
