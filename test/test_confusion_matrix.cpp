#include <gtest/gtest.h>

#include "confusion_matrix.hpp"

namespace nbayes {

class ConfusionMatrixTest : public ::testing::Test {
 protected:
  virtual void SetUp() {
    // predicted, actual
    matrix_.Add("hillary", "hillary");
    matrix_.Add("hillary", "hillary");
    matrix_.Add("hillary", "trump");
    matrix_.Add("trump", "trump");
    matrix_.Add("trump", "trump");
    matrix_.Add("trump", "trump");
    matrix_.Add("trump", "hillary");
  }

  ConfusionMatrix matrix_;
};

TEST_F(ConfusionMatrixTest, Empty) {
  ConfusionMatrix empty;
  EXPECT_EQ(0, empty.total());
  EXPECT_EQ(0, empty.correct());
  EXPECT_DOUBLE_EQ(0, empty.Accuracy());
  EXPECT_DOUBLE_EQ(0, empty.Precision("trump"));
  EXPECT_DOUBLE_EQ(0, empty.Recall("trump"));
  EXPECT_TRUE(empty.classes().empty());
}

TEST_F(ConfusionMatrixTest, Counts) {
  EXPECT_EQ(7, matrix_.total());
  EXPECT_EQ(2, matrix_.count("hillary", "hillary"));
  EXPECT_EQ(1, matrix_.count("hillary", "trump"));
  EXPECT_EQ(3, matrix_.count("trump", "trump"));
  EXPECT_EQ(1, matrix_.count("trump", "hillary"));
  EXPECT_EQ(0, matrix_.count("bernie", "trump"));
  EXPECT_EQ(5, matrix_.correct());
}

TEST_F(ConfusionMatrixTest, Scores) {
  EXPECT_DOUBLE_EQ(5.0 / 7, matrix_.Accuracy());
  EXPECT_DOUBLE_EQ(2.0 / 3, matrix_.Precision("hillary"));
  EXPECT_DOUBLE_EQ(2.0 / 3, matrix_.Recall("hillary"));
  EXPECT_DOUBLE_EQ(3.0 / 4, matrix_.Precision("trump"));
  EXPECT_DOUBLE_EQ(3.0 / 4, matrix_.Recall("trump"));
}

TEST_F(ConfusionMatrixTest, Merge) {
  ConfusionMatrix other;
  other.Add("trump", "trump");
  other.Add("bernie", "hillary");
  matrix_.Merge(other);
  EXPECT_EQ(9, matrix_.total());
  EXPECT_EQ(4, matrix_.count("trump", "trump"));
  EXPECT_EQ(1, matrix_.count("bernie", "hillary"));
  EXPECT_EQ(6, matrix_.correct());
  ASSERT_EQ(3u, matrix_.classes().size());
  EXPECT_EQ("bernie", matrix_.classes()[0]);
}

TEST_F(ConfusionMatrixTest, ToString) {
  const string table = matrix_.ToString();
  EXPECT_NE(string::npos, table.find("hillary"));
  EXPECT_NE(string::npos, table.find("trump"));
  EXPECT_NE(string::npos, table.find("accuracy 5/7"));
}

}  // namespace nbayes
