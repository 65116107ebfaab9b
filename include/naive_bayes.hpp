#ifndef NBAYES_NAIVE_BAYES_HPP_
#define NBAYES_NAIVE_BAYES_HPP_

#include "common.hpp"
#include "confusion_matrix.hpp"
#include "errors.hpp"
#include "vocab.hpp"
#include "nbayes.pb.h"
#include <unordered_map>

namespace nbayes {

// Outcome of classifying one text.
struct Prediction {
  // Predicted class and its position in NaiveBayes::classes().
  string label;
  int class_idx;
  // Class order of log_scores (a copy of NaiveBayes::classes()).
  vector<string> classes;
  // Unnormalized log posterior: log prior + sum of log word probabilities.
  DoubleVec log_scores;
  int num_known_tokens;
  // Tokens not in the vocabulary; they contribute nothing to any score.
  int num_unknown_tokens;

  Prediction() : class_idx(-1), num_known_tokens(0), num_unknown_tokens(0) { }

  // log p(class | text), normalized with a max-shifted log-sum-exp.
  DoubleVec LogPosteriors() const;
  map<string, double> ScoreByClass() const;
};

// Multinomial Naive Bayes over word occurrences with additive smoothing.
//
// Untrained until Fit() succeeds; Fit() may be called only once. All the
// tables are frozen afterwards, so Predict() and Evaluate() may be called
// from several threads at once.
class NaiveBayes {
 public:
  explicit NaiveBayes(const double smoothing = kDefaultSmoothing);
  // Takes smoothing and the declared class set from param.
  explicit NaiveBayes(const ClassifierParameter& param);

  // Trains on (text, class) pairs. Throws EmptyTrainingSetError,
  // LabelMismatchError or ModelAlreadyTrainedError; the model is unchanged
  // when it throws.
  void Fit(const vector<LabeledText>& docs);
  void Fit(const vector<string>& texts, const vector<string>& labels);

  // Throws ModelNotTrainedError before Fit().
  Prediction Predict(const string& text) const;

  // Confusion matrix of Predict() over labeled documents. With
  // num_threads > 1 the documents are split among that many threads.
  ConfusionMatrix Evaluate(const vector<LabeledText>& docs,
      const int num_threads = 1) const;
  ConfusionMatrix Evaluate(const vector<string>& texts,
      const vector<string>& labels, const int num_threads = 1) const;

  // -1 if cls is not a class of the model.
  int class_idx(const string& cls) const;

  inline bool trained() const { return trained_; }
  inline double smoothing() const { return smoothing_; }
  inline const vector<string>& classes() const { return classes_; }
  inline int num_classes() const { return classes_.size(); }
  inline const Vocabulary& vocab() const { return vocab_; }
  inline int num_docs() const { return num_docs_; }

  // Per-class tables; cls must be a class of the trained model. Words out of
  // the vocabulary give 0.
  int class_document_count(const string& cls) const;
  double log_prior(const string& cls) const;
  double word_count(const string& cls, const string& word) const;
  double word_probability(const string& cls, const string& word) const;

 private:
  int ClassIdxOrDie(const string& cls) const;
  void EvaluateRange(const vector<LabeledText>& docs, const size_t begin,
      const size_t end, ConfusionMatrix* matrix) const;

 private:
  double smoothing_;
  // Classes given by the configuration; empty means "as seen in training".
  vector<string> declared_classes_;

  bool trained_;
  int num_docs_;

  vector<string> classes_;
  std::unordered_map<string, int> class_idxes_;
  Vocabulary vocab_;

  // class_idx => #documents
  vector<int> class_doc_counts_;
  // class_idx => word_idx => smoothed occurrence count
  vector<DoubleVec> word_counts_;
  // class_idx => word_idx => word_counts_ / (class_doc_counts_ + K*smoothing)
  vector<DoubleVec> word_probs_;
  vector<DoubleVec> log_word_probs_;
  DoubleVec log_priors_;
};

} // namespace nbayes

#endif
