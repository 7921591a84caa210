#pragma once

#include <algorithm>
#include <cassert>
#include <cmath>
#include <stdexcept>
#include <vector>

#include "DataStructures/Lottery/DrawRecord.h"
#include "DataStructures/Lottery/LotteryErrors.h"
#include "DataStructures/Lottery/PosteriorDistribution.h"
#include "Tools/Constants.h"

// The parameters of the posterior estimation.
struct EstimatorParams {
  double alphaPrimary = DEFAULT_ALPHA;   // The smoothing constant of the primary pool.
  double alphaSecondary = DEFAULT_ALPHA; // The smoothing constant of the secondary pool.
  int recent = 0;                        // Use only the most recent draws (0 means all draws).
  double decay = 1.0;                    // The per-draw time decay (1 means equal weights).

  // Throws std::invalid_argument if some parameter is out of range.
  void validate() const {
    if (alphaPrimary <= 0)
      throw std::invalid_argument("primary smoothing constant is no larger than 0");
    if (alphaSecondary <= 0)
      throw std::invalid_argument("secondary smoothing constant is no larger than 0");
    if (recent < 0)
      throw std::invalid_argument("number of recent draws is smaller than 0");
    if (decay <= 0)
      throw std::invalid_argument("decay is no larger than 0");
    if (decay > 1)
      throw std::invalid_argument("decay is larger than 1");
  }
};

// Converts a collection of historical draws into a per-number probability distribution for each
// of the two pools. For a pool with m numbers, the probability of number n is
//
//   p(n) = (c(n) + alpha) / (sum of all c + m * alpha),
//
// where c(n) is the number of draws in which n appeared. This is the mean of the Dirichlet
// posterior under a symmetric prior, and additive smoothing guarantees p(n) > 0 even for numbers
// that never appeared. The two pools are estimated independently. By default all draws are
// weighted equally; optionally, only the most recent draws are used and/or each draw is weighted
// by decay^age, where age is 0 for the most recent draw.
class PosteriorEstimator {
 public:
  // Constructs a posterior estimator with the specified parameters.
  explicit PosteriorEstimator(const EstimatorParams& params = {}) : params(params) {
    params.validate();
  }

  // Returns the posterior distribution estimated from the specified chronological draws.
  PosteriorDistribution estimate(const std::vector<DrawRecord>& draws) const {
    if (draws.empty())
      throw EmptyDatasetError("cannot estimate posterior from an empty draw history");
    const int numDraws = draws.size();
    const auto first = params.recent > 0 ? std::max(numDraws - params.recent, 0) : 0;
    const auto numUsed = numDraws - first;

    std::vector<double> primaryCounts(NUM_PRIMARY_NUMBERS);
    std::vector<double> secondaryCounts(NUM_SECONDARY_NUMBERS);
    for (auto i = first; i < numDraws; ++i) {
      const auto age = numUsed - 1 - (i - first);
      const auto weight = params.decay == 1.0 ? 1.0 : std::pow(params.decay, age);
      for (const auto number : draws[i].numbers.primary)
        primaryCounts[number - 1] += weight;
      secondaryCounts[draws[i].numbers.secondary - 1] += weight;
    }
    return fromCounts(primaryCounts, secondaryCounts, params.alphaPrimary, params.alphaSecondary);
  }

  // Returns the smoothed posterior distribution for the specified (possibly weighted) counts.
  static PosteriorDistribution fromCounts(
      const std::vector<double>& primaryCounts, const std::vector<double>& secondaryCounts,
      const double alphaPrimary = DEFAULT_ALPHA, const double alphaSecondary = DEFAULT_ALPHA) {
    assert(primaryCounts.size() == NUM_PRIMARY_NUMBERS);
    assert(secondaryCounts.size() == NUM_SECONDARY_NUMBERS);
    return {smooth(primaryCounts, alphaPrimary), smooth(secondaryCounts, alphaSecondary)};
  }

 private:
  // Applies additive smoothing to the specified counts and normalizes them.
  static std::vector<double> smooth(const std::vector<double>& counts, const double alpha) {
    assert(alpha > 0);
    auto total = 0.0;
    for (const auto count : counts) {
      assert(count >= 0);
      total += count;
    }
    const auto denominator = total + counts.size() * alpha;
    std::vector<double> probs(counts.size());
    for (auto i = 0; i < counts.size(); ++i)
      probs[i] = (counts[i] + alpha) / denominator;
    return probs;
  }

  const EstimatorParams params; // The parameters of the estimation.
};
