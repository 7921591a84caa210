#pragma once

#include <algorithm>
#include <array>
#include <cassert>
#include <cmath>
#include <cstdint>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <vector>

#include "Algorithms/CandidateGeneration/WeightedSampler.h"
#include "DataStructures/Lottery/Candidate.h"
#include "DataStructures/Lottery/NumberSet.h"
#include "DataStructures/Lottery/PosteriorDistribution.h"
#include "Tools/Constants.h"

// Produces candidate plays from a posterior distribution. In top mode, the candidate consists of
// the six most probable primary numbers and the most probable secondary number, ties broken in
// favor of the smaller number. In sample mode, the primary numbers of each candidate are drawn by
// weighted sampling without replacement, and the secondary number by one weighted draw. The
// sampling weights are proportional to the posterior probabilities raised to 1/temperature, so a
// temperature above one flattens and a temperature below one sharpens the distribution.
class CandidateGenerator {
 public:
  // Constructs a candidate generator for the specified posterior distribution.
  explicit CandidateGenerator(const PosteriorDistribution& posterior, const double temperature = 1)
      : posterior(posterior),
        primaryWeights(toWeights(posterior.primaryProbabilities(), temperature)),
        secondaryWeights(toWeights(posterior.secondaryProbabilities(), temperature)) {}

  // Returns the deterministic top candidate.
  Candidate buildTop() const {
    const auto& probs = posterior.primaryProbabilities();
    std::vector<int> order(NUM_PRIMARY_NUMBERS);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](const int a, const int b) {
      return probs[a] > probs[b];
    });

    std::array<int, NUM_PRIMARY_PICKS> primary;
    for (auto i = 0; i < NUM_PRIMARY_PICKS; ++i)
      primary[i] = order[i] + 1;

    const auto& secondaryProbs = posterior.secondaryProbabilities();
    auto secondary = 0;
    for (auto i = 1; i < NUM_SECONDARY_NUMBERS; ++i)
      if (secondaryProbs[i] > secondaryProbs[secondary])
        secondary = i;
    return Candidate(NumberSet(primary, secondary + 1), 0);
  }

  // Returns the specified number of sampled candidates. All randomness comes from one engine that
  // is started with the specified seed, so equal seeds yield equal candidate sequences.
  std::vector<Candidate> buildSamples(const int count, const uint64_t seed) const {
    if (count < 0)
      throw std::invalid_argument("number of samples is smaller than 0");
    WeightedSampler sampler(seed);
    std::vector<Candidate> samples;
    samples.reserve(count);
    for (auto k = 1; k <= count; ++k)
      samples.emplace_back(sample(sampler), k);
    return samples;
  }

  // Draws the numbers of one candidate, consuming exactly seven values from the sampler.
  NumberSet sample(WeightedSampler& sampler) const {
    const auto drawn = sampler.drawWithoutReplacement(primaryWeights, NUM_PRIMARY_PICKS);
    std::array<int, NUM_PRIMARY_PICKS> primary;
    for (auto i = 0; i < NUM_PRIMARY_PICKS; ++i)
      primary[i] = drawn[i] + 1;
    const auto secondary = sampler.draw(secondaryWeights) + 1;
    const NumberSet numbers(primary, secondary);
    assert(numbers.isValid());
    return numbers;
  }

 private:
  // Converts probabilities into sampling weights for the specified temperature. The weights are
  // computed in log space relative to the most probable number, which gets weight one. Weights
  // too small to represent are raised to the smallest normalized double, so that the sampler
  // never sees a zero weight.
  static std::vector<double> toWeights(const std::vector<double>& probs, const double temperature) {
    if (temperature <= 0)
      throw std::invalid_argument("temperature is no larger than 0");
    if (temperature == 1)
      return probs;
    const auto logMax = std::log(*std::max_element(probs.begin(), probs.end()));
    std::vector<double> weights(probs.size());
    for (auto i = 0; i < probs.size(); ++i) {
      weights[i] = std::exp((std::log(probs[i]) - logMax) / temperature);
      weights[i] = std::max(weights[i], std::numeric_limits<double>::min());
    }
    return weights;
  }

  const PosteriorDistribution& posterior;    // The posterior the candidates are drawn from.
  const std::vector<double> primaryWeights;   // The sampling weights of the primary numbers.
  const std::vector<double> secondaryWeights; // The sampling weights of the secondary numbers.
};
