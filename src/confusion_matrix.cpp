#include "confusion_matrix.hpp"

#include <iomanip>
#include <boost/foreach.hpp>

namespace nbayes {

typedef pair<const ConfusionMatrix::PredActualPair, int> CountPair;

void ConfusionMatrix::Merge(const ConfusionMatrix& other) {
  BOOST_FOREACH(const CountPair& ele, other.counts_) {
    counts_[ele.first] += ele.second;
  }
  total_ += other.total_;
}

int ConfusionMatrix::count(const string& predicted,
    const string& actual) const {
  auto it = counts_.find(make_pair(predicted, actual));
  return (it == counts_.end()) ? 0 : it->second;
}

int ConfusionMatrix::correct() const {
  int correct = 0;
  BOOST_FOREACH(const CountPair& ele, counts_) {
    if (ele.first.first == ele.first.second) {
      correct += ele.second;
    }
  }
  return correct;
}

double ConfusionMatrix::Accuracy() const {
  if (total_ == 0) {
    return 0;
  }
  return static_cast<double>(correct()) / total_;
}

double ConfusionMatrix::Precision(const string& cls) const {
  int num_predicted = 0;
  BOOST_FOREACH(const CountPair& ele, counts_) {
    if (ele.first.first == cls) {
      num_predicted += ele.second;
    }
  }
  if (num_predicted == 0) {
    return 0;
  }
  return static_cast<double>(count(cls, cls)) / num_predicted;
}

double ConfusionMatrix::Recall(const string& cls) const {
  int num_actual = 0;
  BOOST_FOREACH(const CountPair& ele, counts_) {
    if (ele.first.second == cls) {
      num_actual += ele.second;
    }
  }
  if (num_actual == 0) {
    return 0;
  }
  return static_cast<double>(count(cls, cls)) / num_actual;
}

vector<string> ConfusionMatrix::classes() const {
  set<string> classes;
  BOOST_FOREACH(const CountPair& ele, counts_) {
    classes.insert(ele.first.first);
    classes.insert(ele.first.second);
  }
  return vector<string>(classes.begin(), classes.end());
}

string ConfusionMatrix::ToString() const {
  const vector<string> cls = classes();
  size_t width = 10;
  for (const auto& c : cls) {
    width = max(width, c.size() + 2);
  }
  ostringstream oss;
  oss << std::setw(width) << "pred\\true";
  for (const auto& actual : cls) {
    oss << std::setw(width) << actual;
  }
  oss << "\n";
  for (const auto& predicted : cls) {
    oss << std::setw(width) << predicted;
    for (const auto& actual : cls) {
      oss << std::setw(width) << count(predicted, actual);
    }
    oss << "\n";
  }
  oss << "accuracy " << correct() << "/" << total_ << " = " << Accuracy();
  return oss.str();
}

} // namespace nbayes
