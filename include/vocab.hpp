#ifndef NBAYES_VOCAB_HPP_
#define NBAYES_VOCAB_HPP_

#include "common.hpp"
#include <unordered_map>

namespace nbayes {

// Interns tokens to dense indices in first-seen order and keeps the global
// (smoothed) occurrence count of every token.
class Vocabulary {
 public:
  static const int kUnknownWordIdx = -1;

  explicit Vocabulary() { }

  // Returns the index of word, inserting it with init_count if unseen.
  int Insert(const string& word, const double init_count);

  inline void IncCount(const int word_idx, const double delta) {
#ifdef DEBUG
    CHECK_LT(word_idx, counts_.size());
#endif
    counts_[word_idx] += delta;
  }

  // kUnknownWordIdx if word is out of vocabulary.
  inline int Find(const string& word) const {
    auto it = word_idxes_.find(word);
    return (it == word_idxes_.end()) ? kUnknownWordIdx : it->second;
  }
  inline bool Contains(const string& word) const {
    return word_idxes_.find(word) != word_idxes_.end();
  }

  // 0 for out-of-vocabulary words.
  double count(const string& word) const;

  // The k most frequent words, ties broken alphabetically.
  vector<StrDoublePair> TopWords(const int k) const;

  inline const string& word(const int word_idx) const {
    return words_[word_idx];
  }
  inline double count(const int word_idx) const { return counts_[word_idx]; }
  inline const vector<string>& words() const { return words_; }
  inline int size() const { return words_.size(); }
  inline bool empty() const { return words_.empty(); }

 private:
  std::unordered_map<string, int> word_idxes_;
  // word_idx => word
  vector<string> words_;
  // word_idx => global occurrence count
  DoubleVec counts_;
};

} // namespace nbayes

#endif
