#include <gtest/gtest.h>

#include "vocab.hpp"

namespace nbayes {

class VocabularyTest : public ::testing::Test {
 protected:
  virtual void SetUp() {
    vocab_.Insert("love", 2);
    vocab_.Insert("cats", 2);
    vocab_.Insert("dogs", 2);
    vocab_.IncCount(vocab_.Find("cats"), 3);
    vocab_.IncCount(vocab_.Find("love"), 1);
  }

  Vocabulary vocab_;
};

TEST_F(VocabularyTest, InternsInFirstSeenOrder) {
  EXPECT_EQ(3, vocab_.size());
  EXPECT_EQ(0, vocab_.Find("love"));
  EXPECT_EQ(1, vocab_.Find("cats"));
  EXPECT_EQ(2, vocab_.Find("dogs"));
  EXPECT_EQ("cats", vocab_.word(1));
}

TEST_F(VocabularyTest, InsertExistingKeepsIndexAndCount) {
  EXPECT_EQ(1, vocab_.Insert("cats", 100));
  EXPECT_EQ(3, vocab_.size());
  EXPECT_DOUBLE_EQ(5, vocab_.count("cats"));
}

TEST_F(VocabularyTest, UnknownWord) {
  EXPECT_EQ(Vocabulary::kUnknownWordIdx, vocab_.Find("birds"));
  EXPECT_FALSE(vocab_.Contains("birds"));
  EXPECT_DOUBLE_EQ(0, vocab_.count("birds"));
}

TEST_F(VocabularyTest, TopWords) {
  vector<StrDoublePair> top = vocab_.TopWords(2);
  ASSERT_EQ(2u, top.size());
  EXPECT_EQ("cats", top[0].first);
  EXPECT_DOUBLE_EQ(5, top[0].second);
  EXPECT_EQ("love", top[1].first);
  EXPECT_DOUBLE_EQ(3, top[1].second);

  EXPECT_EQ(3u, vocab_.TopWords(10).size());
  EXPECT_TRUE(vocab_.TopWords(0).empty());
}

}  // namespace nbayes
