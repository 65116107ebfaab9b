#ifndef NBAYES_RANDOM_HPP_
#define NBAYES_RANDOM_HPP_

#include <algorithm>

#include <boost/random/mersenne_twister.hpp>
#include <boost/random/uniform_int_distribution.hpp>

#include "common.hpp"

namespace nbayes {

// Random number generator
class Random {
  boost::mt19937 generator;

public:
  Random(unsigned int seed) :
    generator(seed)
  { }

  // Draws a random integer in [0, n)
  size_t randIndex(size_t n) {
    boost::random::uniform_int_distribution<size_t> index_dist(0, n - 1);
    return index_dist(generator);
  }

  // Fisher-Yates shuffle of the whole vector
  template <typename T>
  void shuffle(vector<T>& v) {
    for (size_t i = v.size(); i > 1; --i) {
      std::swap(v[i - 1], v[randIndex(i)]);
    }
  }
}; // Random

} // namespace nbayes

#endif
