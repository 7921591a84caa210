#pragma once

#include <algorithm>
#include <vector>

#include "Algorithms/CandidateGeneration/CandidateGenerator.h"
#include "Algorithms/Posterior/PosteriorEstimator.h"
#include "Algorithms/Scoring/UtilityScorer.h"
#include "Algorithms/Selection/CompetitiveSelector.h"
#include "Algorithms/Suggestion/RunConfig.h"
#include "DataStructures/Lottery/Candidate.h"
#include "DataStructures/Lottery/Import/HistoricalDrawStore.h"
#include "DataStructures/Lottery/PosteriorDistribution.h"
#include "DataStructures/Lottery/SelectionResult.h"

// Runs the whole suggestion pipeline for the specified historical draws: estimates the posterior,
// builds the top candidate, samples candidates (in sample mode), and selects a winner among top
// and samples (unless the selector is disabled). The run owns its posterior and its random number
// engine, so independent runs may execute concurrently.
inline SelectionResult suggestNumbers(const HistoricalDrawStore& store, const RunConfig& config) {
  config.validate();
  const PosteriorEstimator estimator(config.estimator);
  const PosteriorDistribution posterior = estimator.estimate(store.records());
  const CandidateGenerator generator(posterior, config.temperature);
  const UtilityScorer scorer(posterior);

  SelectionResult result(generator.buildTop());
  scorer.assignScore(result.top);
  result.nextPeriod = store.nextPeriod();
  if (config.mode == SuggestionMode::TOP)
    return result;

  result.samples = generator.buildSamples(config.numSamples, config.seed);
  for (auto& sample : result.samples)
    scorer.assignScore(sample);
  if (!config.runSelector)
    return result;

  std::vector<Candidate> pool;
  pool.reserve(result.samples.size() + 1);
  pool.push_back(result.top);
  pool.insert(pool.end(), result.samples.begin(), result.samples.end());

  CompetitiveSelector selector(scorer, config.beta);
  const auto winner = selector.run(pool);
  result.top = pool.front();
  std::copy(pool.begin() + 1, pool.end(), result.samples.begin());
  result.winner = pool[winner];
  result.winnerScore = selector.stats.winnerScore;
  result.history = selector.stats;
  result.hasWinner = true;
  return result;
}
