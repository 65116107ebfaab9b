#include "vocab.hpp"
#include "util.hpp"

namespace nbayes {

const int Vocabulary::kUnknownWordIdx;

int Vocabulary::Insert(const string& word, const double init_count) {
  auto it = word_idxes_.find(word);
  if (it != word_idxes_.end()) {
    return it->second;
  }
  int word_idx = words_.size();
  word_idxes_[word] = word_idx;
  words_.push_back(word);
  counts_.push_back(init_count);
  return word_idx;
}

double Vocabulary::count(const string& word) const {
  int word_idx = Find(word);
  if (word_idx == kUnknownWordIdx) {
    return 0;
  }
  return counts_[word_idx];
}

vector<StrDoublePair> Vocabulary::TopWords(const int k) const {
  vector<StrDoublePair> word_counts;
  word_counts.reserve(words_.size());
  for (int w_idx = 0; w_idx < words_.size(); ++w_idx) {
    word_counts.push_back(make_pair(words_[w_idx], counts_[w_idx]));
  }
  CHECK_GE(k, 0);
  const int top_k = min<int>(k, word_counts.size());
  std::partial_sort(word_counts.begin(), word_counts.begin() + top_k,
      word_counts.end(), DesSortBySecondOfStrDoublePair());
  word_counts.resize(top_k);
  return word_counts;
}

} // namespace nbayes
