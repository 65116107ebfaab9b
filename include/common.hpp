#ifndef NBAYES_COMMON_HPP_
#define NBAYES_COMMON_HPP_

#include <cmath>
#include <fstream>  // NOLINT(readability/streams)
#include <iostream>  // NOLINT(readability/streams)
#include <map>
#include <set>
#include <sstream>
#include <string>
#include <utility>  // pair
#include <vector>
#include <limits>
#include <algorithm>

#include <gflags/gflags.h>
#include <glog/logging.h>

// gflags 2.1 issue: namespace google was changed to gflags without warning.
// Luckily we will be able to use GFLAGS_GFAGS_H_ to detect if it is version
// 2.1. If yes , we will add a temporary solution to redirect the namespace.
#ifndef GFLAGS_GFLAGS_H_
namespace gflags = google;
#endif  // GFLAGS_GFLAGS_H_

namespace nbayes {

using std::fstream;
using std::ios;
using std::make_pair;
using std::vector;
using std::map;
using std::ostringstream;
using std::pair;
using std::set;
using std::string;
using std::stringstream;
using std::max;
using std::min;

class ConfusionMatrix;
class Dataset;
class NaiveBayes;
class Vocabulary;

// Constants
const double kDefaultSmoothing = 1.0;

// Typedefs
typedef vector<double> DoubleVec;
typedef vector<string> TokenVec;
// (raw text, class name)
typedef pair<string, string> LabeledText;
typedef pair<string, double> StrDoublePair;

} // namespace nbayes

#endif
