#pragma once

#include <algorithm>
#include <cassert>
#include <stdexcept>
#include <utility>
#include <vector>

#include <boost/dynamic_bitset.hpp>

#include "Algorithms/Scoring/UtilityScorer.h"
#include "DataStructures/Lottery/Candidate.h"
#include "DataStructures/Lottery/LotteryErrors.h"
#include "Stats/Selection/CompetitiveSelectionStats.h"
#include "Tools/Constants.h"

// A competitive re-scoring ("re-bargaining") procedure that picks one winner from a pool of
// candidates, trading off intrinsic likelihood against redundancy with the other candidates. The
// overlap penalty of an active candidate is the total number of primary numbers it shares with
// the other active candidates, and its adjusted utility is U = log-likelihood - beta * penalty.
// In each round, we compute U for all active candidates and eliminate the one with minimum U
// (among equal minima, the one with the larger generation index, so the top candidate always wins
// ties). The last survivor is the winner, and its U in the final round is its reported score.
class CompetitiveSelector {
 public:
  // Constructs a competitive selector with the specified penalty weight.
  CompetitiveSelector(const UtilityScorer& scorer, const double beta) : scorer(scorer), beta(beta) {
    if (beta < 0)
      throw std::invalid_argument("penalty weight beta is smaller than 0");
  }

  // Runs the elimination rounds on the specified pool and returns the position of the winner.
  int run(std::vector<Candidate>& pool) {
    if (pool.empty())
      throw InvalidPoolError("competitive selection invoked on an empty candidate pool");
    stats.reset();
    const size_t poolSize = pool.size();

    // Precompute the number of shared primary numbers for each pair of candidates.
    std::vector<boost::dynamic_bitset<>> masks;
    masks.reserve(poolSize);
    for (auto& candidate : pool) {
      scorer.assignScore(candidate);
      candidate.eliminationRound = INVALID_INDEX;
      masks.push_back(candidate.numbers.primaryMask());
    }
    std::vector<int> overlap(poolSize * poolSize);
    for (size_t i = 0; i < poolSize; ++i)
      for (size_t j = 0; j < poolSize; ++j)
        overlap[i * poolSize + j] = i != j ? (masks[i] & masks[j]).count() : 0;

    std::vector<int> active(poolSize);
    for (size_t i = 0; i < poolSize; ++i)
      active[i] = i;

    for (auto round = 1; true; ++round) {
      SelectionRound curRound;
      auto weakest = INVALID_INDEX;
      for (const auto i : active) {
        auto penalty = 0;
        for (const auto j : active)
          penalty += overlap[i * poolSize + j];
        auto& candidate = pool[i];
        candidate.adjustedUtility = candidate.logLikelihood - beta * penalty;
        curRound.entries.emplace_back(
            candidate.index, candidate.logLikelihood, penalty, candidate.adjustedUtility);
        if (weakest == INVALID_INDEX || isWeaker(candidate, pool[weakest]))
          weakest = i;
      }

      if (active.size() == 1) {
        const auto& winner = pool[active.front()];
        stats.rounds.push_back(std::move(curRound));
        stats.winner = winner.index;
        stats.winnerScore = winner.adjustedUtility;
        if (poolSize == 1)
          stats.decidingUtility = winner.adjustedUtility;
        return active.front();
      }

      pool[weakest].eliminationRound = round;
      curRound.eliminated = pool[weakest].index;
      stats.eliminationOrder.push_back(pool[weakest].index);
      active.erase(std::find(active.begin(), active.end(), weakest));
      if (active.size() == 1)
        stats.decidingUtility = pool[active.front()].adjustedUtility;
      stats.rounds.push_back(std::move(curRound));
    }
  }

  CompetitiveSelectionStats stats; // Statistics about the last selection.

 private:
  // Returns true if candidate a should be eliminated before candidate b.
  static bool isWeaker(const Candidate& a, const Candidate& b) {
    assert(a.index != b.index);
    if (a.adjustedUtility != b.adjustedUtility)
      return a.adjustedUtility < b.adjustedUtility;
    return a.index > b.index;
  }

  const UtilityScorer& scorer; // The scorer assigning the intrinsic log-likelihoods.
  const double beta;           // The weight of the overlap penalty.
};
