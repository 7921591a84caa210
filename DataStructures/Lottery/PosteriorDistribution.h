#pragma once

#include <cassert>
#include <utility>
#include <vector>

#include "Tools/Constants.h"

// Two independent finite probability distributions, one over the primary pool and one over the
// secondary pool. Every number has strictly positive probability, and each distribution sums to
// one. A posterior distribution is read-only once constructed.
class PosteriorDistribution {
 public:
  // Constructs a posterior distribution from the probabilities of the numbers 1, 2, ..., n.
  PosteriorDistribution(std::vector<double> primaryProbs, std::vector<double> secondaryProbs)
      : primaryProbs(std::move(primaryProbs)), secondaryProbs(std::move(secondaryProbs)) {
    assert(this->primaryProbs.size() == NUM_PRIMARY_NUMBERS);
    assert(this->secondaryProbs.size() == NUM_SECONDARY_NUMBERS);
  }

  // Returns a posterior distribution that assigns equal probability to all numbers of a pool.
  static PosteriorDistribution uniform() {
    return {
      std::vector<double>(NUM_PRIMARY_NUMBERS, 1.0 / NUM_PRIMARY_NUMBERS),
      std::vector<double>(NUM_SECONDARY_NUMBERS, 1.0 / NUM_SECONDARY_NUMBERS)};
  }

  // Returns the probability of the specified primary number.
  double primary(const int number) const {
    assert(number >= 1); assert(number <= NUM_PRIMARY_NUMBERS);
    return primaryProbs[number - 1];
  }

  // Returns the probability of the specified secondary number.
  double secondary(const int number) const {
    assert(number >= 1); assert(number <= NUM_SECONDARY_NUMBERS);
    return secondaryProbs[number - 1];
  }

  // Returns the probabilities of the primary numbers. Index i refers to the number i + 1.
  const std::vector<double>& primaryProbabilities() const noexcept {
    return primaryProbs;
  }

  // Returns the probabilities of the secondary numbers. Index i refers to the number i + 1.
  const std::vector<double>& secondaryProbabilities() const noexcept {
    return secondaryProbs;
  }

 private:
  std::vector<double> primaryProbs;   // The probabilities of the primary numbers.
  std::vector<double> secondaryProbs; // The probabilities of the secondary numbers.
};
