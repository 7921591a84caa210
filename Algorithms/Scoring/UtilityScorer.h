#pragma once

#include <cassert>
#include <cmath>

#include "DataStructures/Lottery/Candidate.h"
#include "DataStructures/Lottery/NumberSet.h"
#include "DataStructures/Lottery/PosteriorDistribution.h"

// Scores the intrinsic quality of a candidate by its log-likelihood under the posterior, i.e., the
// sum of the log-probabilities of its six primary numbers and its secondary number. Since every
// probability lies in (0, 1), the log-likelihood is always negative; more probable combinations
// score closer to zero.
class UtilityScorer {
 public:
  // Constructs a utility scorer for the specified posterior distribution.
  explicit UtilityScorer(const PosteriorDistribution& posterior) : posterior(posterior) {}

  // Returns the log-likelihood of the specified numbers.
  double score(const NumberSet& numbers) const {
    assert(numbers.isValid());
    auto logLikelihood = 0.0;
    for (const auto number : numbers.primary)
      logLikelihood += std::log(posterior.primary(number));
    logLikelihood += std::log(posterior.secondary(numbers.secondary));
    return logLikelihood;
  }

  // Attaches the log-likelihood to the specified candidate.
  void assignScore(Candidate& candidate) const {
    candidate.logLikelihood = score(candidate.numbers);
  }

 private:
  const PosteriorDistribution& posterior; // The posterior the candidates are scored against.
};
