#pragma once

#include <string>
#include <vector>

#include "DataStructures/Lottery/Candidate.h"
#include "DataStructures/Lottery/NumberSet.h"
#include "Stats/Selection/CompetitiveSelectionStats.h"

// The final deliverable of a suggestion run: the top candidate, the sampled candidates in
// generation order, and the winner of the competitive selection together with the history of
// all selection rounds.
struct SelectionResult {
  // Constructs a result holding only the top candidate.
  explicit SelectionResult(const Candidate& top) : top(top), winner(top), hasWinner(false) {}

  Candidate top;                     // The deterministic top candidate.
  std::vector<Candidate> samples;    // The sampled candidates (empty in top mode).
  Candidate winner;                  // The winner of the selection (valid if hasWinner is set).
  bool hasWinner;                    // Indicates whether the competitive selection ran.
  double winnerScore = 0;            // The winner's final adjusted utility.
  CompetitiveSelectionStats history; // All selection rounds, for auditing.
  std::string nextPeriod;            // The period the suggestion is meant for, if known.
};
