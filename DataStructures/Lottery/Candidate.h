#pragma once

#include <limits>
#include <string>

#include "DataStructures/Lottery/NumberSet.h"
#include "Tools/Constants.h"

// One proposed play. A candidate is either the deterministic top candidate (generation index 0)
// or the k-th sampled candidate (generation index k). The log-likelihood is attached by the
// utility scorer, the adjusted utility and the elimination round by the competitive selector.
struct Candidate {
  // Constructs a candidate with the specified numbers and generation index.
  Candidate(const NumberSet& numbers, const int index)
      : numbers(numbers),
        index(index),
        logLikelihood(std::numeric_limits<double>::quiet_NaN()),
        adjustedUtility(std::numeric_limits<double>::quiet_NaN()),
        eliminationRound(INVALID_INDEX) {}

  // Returns true if this is the deterministic top candidate.
  bool isTop() const noexcept {
    return index == 0;
  }

  // Returns the provenance tag, 'top' or 'sample#k'.
  std::string tag() const {
    return isTop() ? "top" : "sample#" + std::to_string(index);
  }

  NumberSet numbers;      // The numbers of this candidate.
  int index;              // The generation index (0 for the top candidate).
  double logLikelihood;   // The intrinsic log-likelihood under the posterior.
  double adjustedUtility; // The overlap-adjusted utility from the latest selection round.
  int eliminationRound;   // The round in which this candidate was eliminated, if any.
};
