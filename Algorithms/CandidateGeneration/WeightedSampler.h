#pragma once

#include <cassert>
#include <cstdint>
#include <random>
#include <vector>

#include <boost/dynamic_bitset.hpp>

#include "Tools/Constants.h"

// A source of weighted random choices whose output is the same on every platform. The underlying
// engine is std::mt19937_64, whose output sequence is fixed by the C++ standard. We do not use the
// standard distributions, since their output varies between library implementations. Each call
// to draw consumes exactly one value from the engine.
class WeightedSampler {
 public:
  // Constructs a weighted sampler whose engine is started with the specified seed.
  explicit WeightedSampler(const uint64_t seed) : engine(seed) {}

  // Returns a uniformly distributed real number in [0, 1).
  double nextUniform() {
    return (engine() >> 11) * (1.0 / 9007199254740992.0);
  }

  // Draws an index with probability proportional to its weight among the indices not yet taken.
  // The chosen index is the first one whose running cumulative weight exceeds u * W, where W is
  // the total weight of the available indices. Rounding errors resolve to the last available one.
  int draw(const std::vector<double>& weights, const boost::dynamic_bitset<>& taken) {
    assert(taken.size() == weights.size());
    auto total = 0.0;
    for (auto i = 0; i < weights.size(); ++i)
      if (!taken[i]) {
        assert(weights[i] > 0);
        total += weights[i];
      }
    assert(total > 0);

    const auto target = nextUniform() * total;
    auto cumulative = 0.0;
    auto last = INVALID_INDEX;
    for (auto i = 0; i < weights.size(); ++i) {
      if (taken[i])
        continue;
      cumulative += weights[i];
      last = i;
      if (target < cumulative)
        return i;
    }
    assert(last != INVALID_INDEX);
    return last;
  }

  // Draws an index with probability proportional to its weight.
  int draw(const std::vector<double>& weights) {
    return draw(weights, boost::dynamic_bitset<>(weights.size()));
  }

  // Draws k distinct indices by repeated weighted draws without replacement, i.e., each draw is
  // renormalized over the indices not drawn before. The indices are returned in drawing order.
  std::vector<int> drawWithoutReplacement(const std::vector<double>& weights, const int k) {
    assert(k >= 0); assert(k <= weights.size());
    boost::dynamic_bitset<> taken(weights.size());
    std::vector<int> drawn;
    drawn.reserve(k);
    for (auto i = 0; i < k; ++i) {
      const auto idx = draw(weights, taken);
      assert(!taken[idx]);
      taken[idx] = true;
      drawn.push_back(idx);
    }
    return drawn;
  }

 private:
  std::mt19937_64 engine; // The engine all randomness is drawn from.
};
