#ifndef NBAYES_UTIL_HPP_
#define NBAYES_UTIL_HPP_

#include "common.hpp"

#include <cmath>
#include <cstdint>
#include <algorithm>

namespace nbayes {

/*
 * log(sum_i exp(x_i)), shifted by the max element so that no exp() overflows
 * and at least one term is exactly 1.
 *
 */
inline double log_sum_exp(const DoubleVec& x) {
  CHECK(!x.empty());
  double max_log = *std::max_element(x.begin(), x.end());
  if (std::isinf(max_log)) {
    return max_log;
  }
  double sum = 0;
  for (size_t i = 0; i < x.size(); ++i) {
    sum += exp(x[i] - max_log);
  }
  return max_log + log(sum);
}

/*
 * argmax; ties go to the smallest index
 *
 */
inline int argmax(const DoubleVec& x) {
  CHECK(!x.empty());
  double max = x[0];
  int argmax = 0;
  for (size_t i = 1; i < x.size(); i++)
  {
    if (x[i] > max)
    {
      max = x[i];
      argmax = i;
    }
  }
  return argmax;
}

// Number of items that make up percent% of total, rounded down. Computed in 64
// bits so that large corpora do not overflow.
inline int percent_of(const int total, const int percent) {
  CHECK_GE(total, 0);
  CHECK_GE(percent, 0);
  CHECK_LE(percent, 100);
  return static_cast<int>(static_cast<int64_t>(total) * percent / 100);
}

struct DesSortBySecondOfStrDoublePair {
  bool operator() (const StrDoublePair& a, const StrDoublePair& b) const {
    return (a.second > b.second
        || (a.second == b.second && a.first < b.first));
  }
};

} // namespace nbayes

#endif
