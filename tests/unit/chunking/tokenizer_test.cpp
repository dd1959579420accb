#include <gtest/gtest.h>

#include "docu_core/chunking/tokenizer.hpp"

namespace docu_tests {

using namespace docu_core;

TEST(PreTokenizerTest, CountTokens_CountsWordsAndPunctuation) {
  PreTokenizer tokenizer;

  EXPECT_EQ(tokenizer.count_tokens("Hello, world!"), 4);
  EXPECT_EQ(tokenizer.count_tokens("don't"), 3);
  EXPECT_EQ(tokenizer.count_tokens(""), 0);
  EXPECT_EQ(tokenizer.count_tokens("   "), 0);
}

TEST(PreTokenizerTest, CountTokens_SeparatesLetterAndDigitRuns) {
  PreTokenizer tokenizer;

  EXPECT_EQ(tokenizer.count_tokens("abc123"), 2);
  EXPECT_EQ(tokenizer.count_tokens("3.14"), 3);
  EXPECT_EQ(tokenizer.count_tokens("snake_case"), 1);
}

TEST(PreTokenizerTest, CountTokens_TreatsNonAsciiAsLetters) {
  PreTokenizer tokenizer;

  EXPECT_EQ(tokenizer.count_tokens("日本語"), 1);
  EXPECT_EQ(tokenizer.count_tokens("café au lait"), 3);
}

TEST(TokenizerFactoryTest, MakeTokenizer_ApproximateHasNoTokenizer) {
  EXPECT_EQ(make_tokenizer(TokenizerKind::Approximate), nullptr);

  auto tokenizer = make_tokenizer(TokenizerKind::PreTokenizer);
  ASSERT_NE(tokenizer, nullptr);
  EXPECT_EQ(tokenizer->name(), "pretokenizer");
}

TEST(ApproximateTokenCountTest, RoundsWordCountTimesFactor) {
  EXPECT_EQ(approximate_token_count("one two"), 3);  // 2.66
  EXPECT_EQ(approximate_token_count("  spaced   words  here "), 4);  // 3.99
}

}  // namespace docu_tests
