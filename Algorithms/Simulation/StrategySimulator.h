#pragma once

#include <algorithm>
#include <iostream>
#include <stdexcept>

#include "Algorithms/CandidateGeneration/WeightedSampler.h"
#include "Algorithms/Simulation/PrizeJudge.h"
#include "Algorithms/Simulation/TicketStrategies.h"
#include "DataStructures/Lottery/NumberSet.h"
#include "DataStructures/Lottery/PosteriorDistribution.h"
#include "Stats/Simulation/StrategySimulationStats.h"
#include "Tools/CommandLine/ProgressBar.h"
#include "Tools/Constants.h"
#include "Tools/OpenMP.h"
#include "Tools/Timer.h"

// A simulator that compares ticket-picking strategies over many independent, uniformly random
// official draws. In each draw, every strategy buys the same number of tickets, and each ticket is
// judged against the draw. The draws are split into blocks of SIM_DRAWS_PER_BLOCK draws that are
// simulated in parallel. Each block owns a random number engine started with seed + block + 1, so
// the results do not depend on the number of threads.
class StrategySimulator {
 public:
  // Constructs a simulator. The posterior strategy draws from the specified posterior.
  StrategySimulator(const PosteriorDistribution& posterior, const int seed, const bool verbose)
      : strategies(posterior), seed(seed), verbose(verbose) {
    if (seed < 0)
      throw std::invalid_argument("seed is smaller than 0");
  }

  // Simulates the specified number of draws.
  void run(const int numDraws, const int ticketsPerDraw) {
    if (numDraws <= 0)
      throw std::invalid_argument("number of draws is no larger than 0");
    if (ticketsPerDraw <= 0)
      throw std::invalid_argument("number of tickets per draw is no larger than 0");
    Timer timer;
    stats = StrategySimulationStats();
    stats.numBetsPerStrategy = static_cast<long long>(numDraws) * ticketsPerDraw;

    const auto numBlocks = (numDraws + SIM_DRAWS_PER_BLOCK - 1) / SIM_DRAWS_PER_BLOCK;
    if (verbose) std::cout << "Simulating draws: ";
    ProgressBar bar(numBlocks, verbose);

    #pragma omp parallel
    {
      StrategySimulationStats localStats;

      #pragma omp for schedule(dynamic, 1) nowait
      for (auto block = 0; block < numBlocks; ++block) {
        WeightedSampler sampler(static_cast<uint64_t>(seed) + block + 1);
        const auto firstDraw = block * SIM_DRAWS_PER_BLOCK;
        const auto lastDraw = std::min(firstDraw + SIM_DRAWS_PER_BLOCK, numDraws);
        for (auto d = firstDraw; d < lastDraw; ++d) {
          const auto draw = strategies.pickUniform(sampler);
          for (auto s = 0; s < NUM_TICKET_STRATEGIES; ++s) {
            const auto strategy = static_cast<TicketStrategy>(s);
            for (auto t = 0; t < ticketsPerDraw; ++t)
              localStats.addHit(strategy, judgePrize(strategies.pick(strategy, sampler), draw));
          }
        }
        ++bar;
      }

      #pragma omp critical (mergeStats)
      stats.merge(localStats);
    }

    bar.finish();
    stats.totalRunningTime = timer.elapsed();
    if (verbose) std::cout << " done (" << stats.totalRunningTime << "ms).\n" << std::flush;
  }

  StrategySimulationStats stats; // Statistics about the last simulation.

 private:
  const TicketStrategies strategies; // The strategies to be compared.
  const int seed;                    // The seed from which the engines of all blocks are derived.
  const bool verbose;                // Should we display informative messages?
};
