#ifndef NBAYES_DATASET_HPP_
#define NBAYES_DATASET_HPP_

#include "common.hpp"
#include "errors.hpp"
#include "nbayes.pb.h"

namespace nbayes {

// Labeled corpus read from a pair of parallel files: one document per line in
// the text file, its label symbol on the same line of the label file.
class Dataset {
 public:
  // raw label symbol => class name
  typedef map<string, string> LabelMap;

  explicit Dataset() { }

  // Empty label_map: symbols are class names. Throws LabelMismatchError if
  // the files have different line counts or a symbol is not mapped.
  void Init(const string& text_file, const string& label_file,
      const LabelMap& label_map = LabelMap());
  // Same, from in-memory lines.
  void Init(const vector<string>& texts, const vector<string>& symbols,
      const LabelMap& label_map = LabelMap());

  static LabelMap MakeLabelMap(const ClassifierParameter& param);

  inline const vector<LabeledText>& documents() const { return documents_; }
  inline const LabeledText& document(const int idx) const {
#ifdef DEBUG
    CHECK_LT(idx, documents_.size());
#endif
    return documents_[idx];
  }
  inline int size() const { return documents_.size(); }
  inline bool empty() const { return documents_.empty(); }

  vector<string> texts() const;
  vector<string> labels() const;
  // #documents per class
  map<string, int> LabelHistogram() const;

 private:
  vector<LabeledText> documents_;
};

} // namespace nbayes

#endif
