#pragma once

#include <iomanip>
#include <limits>

#include "DataStructures/Lottery/SelectionResult.h"
#include "Tools/Logging/LogManager.h"

// Writes every round of the competitive selection to the selection log, one row per candidate.
// Utilities are written with enough digits to tell near-ties apart.
template <typename LoggerT>
inline void writeSelectionLog(const SelectionResult& result) {
  auto& log = LogManager<LoggerT>::getLogger(
      ".rebargain.csv",
      "round,candidate,log_likelihood,overlap_penalty,adjusted_utility,eliminated\n");
  log << std::setprecision(std::numeric_limits<double>::max_digits10);
  const auto& rounds = result.history.rounds;
  for (auto r = 0; r < rounds.size(); ++r)
    for (const auto& entry : rounds[r].entries)
      log << r << ',' << entry.candidate << ',' << entry.logLikelihood << ','
          << entry.overlapPenalty << ',' << entry.adjustedUtility << ','
          << (entry.candidate == rounds[r].eliminated) << '\n';
  log.flush();
}
