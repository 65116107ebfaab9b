#include "naive_bayes.hpp"
#include "tokenizer.hpp"
#include "util.hpp"
#include <cmath>
#include <boost/thread/thread.hpp>
#include <boost/thread/mutex.hpp>

namespace nbayes {

namespace {

vector<LabeledText> PairUp(const vector<string>& texts,
    const vector<string>& labels) {
  if (texts.size() != labels.size()) {
    ostringstream oss;
    oss << "Got " << texts.size() << " texts but " << labels.size()
        << " labels";
    throw LabelMismatchError(oss.str());
  }
  vector<LabeledText> docs;
  docs.reserve(texts.size());
  for (size_t d_idx = 0; d_idx < texts.size(); ++d_idx) {
    docs.push_back(make_pair(texts[d_idx], labels[d_idx]));
  }
  return docs;
}

} // namespace

// ---------------------------- Prediction ------------------------------

DoubleVec Prediction::LogPosteriors() const {
  DoubleVec log_posteriors(log_scores);
  if (log_scores.empty()) {
    return log_posteriors;
  }
  const double log_norm = log_sum_exp(log_scores);
  for (auto& lp : log_posteriors) {
    lp -= log_norm;
  }
  return log_posteriors;
}

map<string, double> Prediction::ScoreByClass() const {
  CHECK_EQ(classes.size(), log_scores.size());
  map<string, double> scores;
  for (int c_idx = 0; c_idx < classes.size(); ++c_idx) {
    scores[classes[c_idx]] = log_scores[c_idx];
  }
  return scores;
}

// ---------------------------- NaiveBayes ------------------------------

NaiveBayes::NaiveBayes(const double smoothing)
    : smoothing_(smoothing), trained_(false), num_docs_(0) {
  CHECK_GT(smoothing_, 0) << "Smoothing must be positive";
}

NaiveBayes::NaiveBayes(const ClassifierParameter& param)
    : smoothing_(param.smoothing()), trained_(false), num_docs_(0) {
  CHECK_GT(smoothing_, 0) << "Smoothing must be positive";
  // Several symbols may map to one class; keep the first occurrence.
  for (int l_idx = 0; l_idx < param.label_size(); ++l_idx) {
    const string& name = param.label(l_idx).name();
    CHECK(!name.empty()) << "Label " << l_idx << " has no class name";
    if (std::find(declared_classes_.begin(), declared_classes_.end(), name)
        == declared_classes_.end()) {
      declared_classes_.push_back(name);
    }
  }
}

void NaiveBayes::Fit(const vector<string>& texts,
    const vector<string>& labels) {
  Fit(PairUp(texts, labels));
}

void NaiveBayes::Fit(const vector<LabeledText>& docs) {
  if (trained_) {
    throw ModelAlreadyTrainedError();
  }
  if (docs.empty()) {
    throw EmptyTrainingSetError("No training documents");
  }

  // Everything is built locally and swapped in once it is complete, so a
  // throw below leaves the model untrained and empty.
  vector<string> classes(declared_classes_);
  std::unordered_map<string, int> class_idxes;
  for (int c_idx = 0; c_idx < classes.size(); ++c_idx) {
    class_idxes[classes[c_idx]] = c_idx;
  }
  vector<int> class_doc_counts(classes.size(), 0);
  vector<DoubleVec> word_counts(classes.size());
  Vocabulary vocab;

  TokenVec tokens;
  for (size_t d_idx = 0; d_idx < docs.size(); ++d_idx) {
    const string& label = docs[d_idx].second;
    int c_idx;
    auto c_it = class_idxes.find(label);
    if (c_it != class_idxes.end()) {
      c_idx = c_it->second;
    } else if (declared_classes_.empty()) {
      // New class: it has silently seen every word interned so far.
      c_idx = classes.size();
      classes.push_back(label);
      class_idxes[label] = c_idx;
      class_doc_counts.push_back(0);
      word_counts.push_back(DoubleVec(vocab.size(), smoothing_));
    } else {
      ostringstream oss;
      oss << "Document " << d_idx << " has undeclared label '" << label << "'";
      throw LabelMismatchError(oss.str());
    }
    ++class_doc_counts[c_idx];

    tokens.clear();
    Tokenizer::Tokenize(docs[d_idx].first, &tokens);
    for (const auto& token : tokens) {
      int w_idx = vocab.Find(token);
      if (w_idx == Vocabulary::kUnknownWordIdx) {
        w_idx = vocab.Insert(token, 2 * smoothing_);
        for (auto& class_word_counts : word_counts) {
          class_word_counts.push_back(smoothing_);
        }
      }
      vocab.IncCount(w_idx, 1);
      word_counts[c_idx][w_idx] += 1;
    }
    VLOG(2) << "doc " << d_idx << " (" << label << "): " << tokens.size()
        << " tokens";
  }

  const int num_classes = classes.size();
  for (int c_idx = 0; c_idx < num_classes; ++c_idx) {
    if (class_doc_counts[c_idx] == 0) {
      throw EmptyTrainingSetError("Class '" + classes[c_idx]
          + "' has no training document");
    }
  }

  // Derived tables
  const int num_words = vocab.size();
  vector<DoubleVec> word_probs(num_classes, DoubleVec(num_words));
  vector<DoubleVec> log_word_probs(num_classes, DoubleVec(num_words));
  DoubleVec log_priors(num_classes);
  for (int c_idx = 0; c_idx < num_classes; ++c_idx) {
    const double denom = class_doc_counts[c_idx] + num_classes * smoothing_;
    for (int w_idx = 0; w_idx < num_words; ++w_idx) {
#ifdef DEBUG
      CHECK_GE(word_counts[c_idx][w_idx], smoothing_);
#endif
      word_probs[c_idx][w_idx] = word_counts[c_idx][w_idx] / denom;
      log_word_probs[c_idx][w_idx] = log(word_probs[c_idx][w_idx]);
    }
    log_priors[c_idx] = log(static_cast<double>(class_doc_counts[c_idx])
        / docs.size());
  }

  classes_.swap(classes);
  class_idxes_.swap(class_idxes);
  class_doc_counts_.swap(class_doc_counts);
  word_counts_.swap(word_counts);
  word_probs_.swap(word_probs);
  log_word_probs_.swap(log_word_probs);
  log_priors_.swap(log_priors);
  std::swap(vocab_, vocab);
  num_docs_ = docs.size();
  trained_ = true;

  LOG(INFO) << "Trained on " << num_docs_ << " docs, " << num_classes
      << " classes, vocab size " << num_words;
  for (int c_idx = 0; c_idx < num_classes; ++c_idx) {
    LOG(INFO) << "  class " << classes_[c_idx] << ": "
        << class_doc_counts_[c_idx] << " docs, log prior "
        << log_priors_[c_idx];
  }
}

Prediction NaiveBayes::Predict(const string& text) const {
  if (!trained_) {
    throw ModelNotTrainedError();
  }
  Prediction prediction;
  prediction.classes = classes_;
  prediction.log_scores = log_priors_;

  const TokenVec tokens = Tokenizer::Tokenize(text);
  for (const auto& token : tokens) {
    const int w_idx = vocab_.Find(token);
    if (w_idx == Vocabulary::kUnknownWordIdx) {
      // Out-of-vocabulary words are ignored by every class.
      ++prediction.num_unknown_tokens;
      continue;
    }
    ++prediction.num_known_tokens;
    for (int c_idx = 0; c_idx < classes_.size(); ++c_idx) {
      prediction.log_scores[c_idx] += log_word_probs_[c_idx][w_idx];
    }
  }

  prediction.class_idx = argmax(prediction.log_scores);
  prediction.label = classes_[prediction.class_idx];
  return prediction;
}

ConfusionMatrix NaiveBayes::Evaluate(const vector<string>& texts,
    const vector<string>& labels, const int num_threads) const {
  return Evaluate(PairUp(texts, labels), num_threads);
}

ConfusionMatrix NaiveBayes::Evaluate(const vector<LabeledText>& docs,
    const int num_threads) const {
  if (!trained_) {
    throw ModelNotTrainedError();
  }
  CHECK_GT(num_threads, 0);
  ConfusionMatrix matrix;
  const size_t num_workers = min<size_t>(num_threads, docs.size());
  if (num_workers <= 1) {
    EvaluateRange(docs, 0, docs.size(), &matrix);
    return matrix;
  }

  boost::mutex matrix_mutex;
  boost::thread_group workers;
  const size_t chunk = (docs.size() + num_workers - 1) / num_workers;
  for (size_t t_idx = 0; t_idx < num_workers; ++t_idx) {
    const size_t begin = t_idx * chunk;
    const size_t end = min(begin + chunk, docs.size());
    workers.create_thread([this, &docs, begin, end, &matrix, &matrix_mutex]() {
      ConfusionMatrix partial;
      EvaluateRange(docs, begin, end, &partial);
      boost::mutex::scoped_lock lock(matrix_mutex);
      matrix.Merge(partial);
    });
  }
  workers.join_all();
  return matrix;
}

void NaiveBayes::EvaluateRange(const vector<LabeledText>& docs,
    const size_t begin, const size_t end, ConfusionMatrix* matrix) const {
  for (size_t d_idx = begin; d_idx < end; ++d_idx) {
    const Prediction prediction = Predict(docs[d_idx].first);
    matrix->Add(prediction.label, docs[d_idx].second);
    VLOG(1) << "doc " << d_idx << " predicted " << prediction.label
        << " actual " << docs[d_idx].second;
  }
}

int NaiveBayes::class_idx(const string& cls) const {
  auto it = class_idxes_.find(cls);
  return (it == class_idxes_.end()) ? -1 : it->second;
}

int NaiveBayes::ClassIdxOrDie(const string& cls) const {
  const int c_idx = class_idx(cls);
  CHECK_GE(c_idx, 0) << "Unknown class " << cls;
  return c_idx;
}

int NaiveBayes::class_document_count(const string& cls) const {
  return class_doc_counts_[ClassIdxOrDie(cls)];
}

double NaiveBayes::log_prior(const string& cls) const {
  return log_priors_[ClassIdxOrDie(cls)];
}

double NaiveBayes::word_count(const string& cls, const string& word) const {
  const int c_idx = ClassIdxOrDie(cls);
  const int w_idx = vocab_.Find(word);
  if (w_idx == Vocabulary::kUnknownWordIdx) {
    return 0;
  }
  return word_counts_[c_idx][w_idx];
}

double NaiveBayes::word_probability(const string& cls,
    const string& word) const {
  const int c_idx = ClassIdxOrDie(cls);
  const int w_idx = vocab_.Find(word);
  if (w_idx == Vocabulary::kUnknownWordIdx) {
    return 0;
  }
  return word_probs_[c_idx][w_idx];
}

} // namespace nbayes
