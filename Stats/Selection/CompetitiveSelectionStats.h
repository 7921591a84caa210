#pragma once

#include <vector>

#include "Tools/Constants.h"

// The scores of one candidate in one selection round.
struct RoundEntry {
  // Constructs an entry for the candidate with the specified generation index.
  RoundEntry(const int candidate, const double logLikelihood,
             const int overlapPenalty, const double adjustedUtility)
      : candidate(candidate),
        logLikelihood(logLikelihood),
        overlapPenalty(overlapPenalty),
        adjustedUtility(adjustedUtility) {}

  int candidate;          // The generation index of the candidate.
  double logLikelihood;   // The intrinsic log-likelihood of the candidate.
  int overlapPenalty;     // The number of primary numbers shared with the other active candidates.
  double adjustedUtility; // The log-likelihood minus beta times the overlap penalty.
};

// One round of the competitive selection.
struct SelectionRound {
  std::vector<RoundEntry> entries; // The scores of all candidates active in this round.
  int eliminated = INVALID_INDEX;  // The candidate eliminated in this round (none in the last).
};

// Statistics about a competitive selection, recording every round for auditing.
struct CompetitiveSelectionStats {
  // Clears the statistics of a previous selection.
  void reset() {
    rounds.clear();
    eliminationOrder.clear();
    winner = INVALID_INDEX;
    winnerScore = 0;
    decidingUtility = 0;
  }

  // Returns the number of rounds, including the final round with a single survivor.
  int numRounds() const noexcept {
    return rounds.size();
  }

  std::vector<SelectionRound> rounds;  // All rounds in the order in which they were played.
  std::vector<int> eliminationOrder;   // The eliminated candidates in order of elimination.
  int winner = INVALID_INDEX;          // The generation index of the winner.
  double winnerScore = 0;              // The winner's adjusted utility as sole survivor.
  double decidingUtility = 0;          // The winner's adjusted utility in the deciding round.
};
