#include "dataset.hpp"
#include "io.hpp"
#include <boost/foreach.hpp>
#include <boost/algorithm/string/trim.hpp>

namespace nbayes {

void Dataset::Init(const string& text_file, const string& label_file,
    const LabelMap& label_map) {
  LOG(INFO) << "Read docs " << text_file << " labels " << label_file;
  vector<string> texts;
  vector<string> symbols;
  ReadLines(text_file, &texts);
  ReadLines(label_file, &symbols);
  Init(texts, symbols, label_map);
}

void Dataset::Init(const vector<string>& texts,
    const vector<string>& symbols, const LabelMap& label_map) {
  if (texts.size() != symbols.size()) {
    ostringstream oss;
    oss << "Got " << texts.size() << " docs but " << symbols.size()
        << " labels";
    throw LabelMismatchError(oss.str());
  }
  vector<LabeledText> documents;
  documents.reserve(texts.size());
  for (size_t d_idx = 0; d_idx < texts.size(); ++d_idx) {
    const string symbol = boost::algorithm::trim_copy(symbols[d_idx]);
    if (label_map.empty()) {
      documents.push_back(make_pair(texts[d_idx], symbol));
      continue;
    }
    auto it = label_map.find(symbol);
    if (it == label_map.end()) {
      ostringstream oss;
      oss << "Unknown label symbol '" << symbol << "' at line " << d_idx + 1;
      throw LabelMismatchError(oss.str());
    }
    documents.push_back(make_pair(texts[d_idx], it->second));
  }
  documents_.swap(documents);
  LOG(INFO) << "Total number of docs: " << documents_.size();
}

Dataset::LabelMap Dataset::MakeLabelMap(const ClassifierParameter& param) {
  LabelMap label_map;
  for (int l_idx = 0; l_idx < param.label_size(); ++l_idx) {
    const LabelMapping& mapping = param.label(l_idx);
    CHECK(label_map.find(mapping.symbol()) == label_map.end())
        << "Label symbol '" << mapping.symbol() << "' is mapped twice";
    label_map[mapping.symbol()] = mapping.name();
  }
  return label_map;
}

vector<string> Dataset::texts() const {
  vector<string> texts;
  texts.reserve(documents_.size());
  for (const auto& doc : documents_) {
    texts.push_back(doc.first);
  }
  return texts;
}

vector<string> Dataset::labels() const {
  vector<string> labels;
  labels.reserve(documents_.size());
  for (const auto& doc : documents_) {
    labels.push_back(doc.second);
  }
  return labels;
}

map<string, int> Dataset::LabelHistogram() const {
  map<string, int> histogram;
  BOOST_FOREACH(const LabeledText& doc, documents_) {
    ++histogram[doc.second];
  }
  return histogram;
}

} // namespace nbayes
