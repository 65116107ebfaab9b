#ifndef NBAYES_CONFUSION_MATRIX_HPP_
#define NBAYES_CONFUSION_MATRIX_HPP_

#include "common.hpp"

namespace nbayes {

// Counts of (predicted class, actual class) outcomes.
class ConfusionMatrix {
 public:
  typedef pair<string, string> PredActualPair;

  explicit ConfusionMatrix() : total_(0) { }

  inline void Add(const string& predicted, const string& actual) {
    ++counts_[make_pair(predicted, actual)];
    ++total_;
  }
  void Merge(const ConfusionMatrix& other);

  int count(const string& predicted, const string& actual) const;
  inline int total() const { return total_; }
  int correct() const;

  // 0 on an empty matrix.
  double Accuracy() const;
  // Of the documents predicted as cls, the fraction that are cls; 0 if none.
  double Precision(const string& cls) const;
  // Of the documents that are cls, the fraction predicted as cls; 0 if none.
  double Recall(const string& cls) const;

  // Every class seen either as prediction or as truth, sorted.
  vector<string> classes() const;
  inline const map<PredActualPair, int>& counts() const { return counts_; }

  // Rows are predictions, columns actual classes.
  string ToString() const;

 private:
  map<PredActualPair, int> counts_;
  int total_;
};

} // namespace nbayes

#endif
