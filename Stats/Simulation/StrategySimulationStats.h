#pragma once

#include <array>
#include <cassert>

#include "Algorithms/Simulation/PrizeJudge.h"
#include "Algorithms/Simulation/TicketStrategies.h"

// Statistics about a strategy simulation: the number of tickets that won each prize tier, for each
// strategy, and the running time.
struct StrategySimulationStats {
  // Constructs an empty set of statistics.
  StrategySimulationStats() : numBetsPerStrategy(0), totalRunningTime(0) {
    for (auto& counts : hits)
      counts.fill(0);
  }

  // Records that a ticket of the specified strategy won the specified tier.
  void addHit(const TicketStrategy strategy, const PrizeTier tier) {
    ++hits[static_cast<int>(strategy)][static_cast<int>(tier)];
  }

  // Adds the hits from the specified statistics to these.
  void merge(const StrategySimulationStats& other) {
    for (auto s = 0; s < NUM_TICKET_STRATEGIES; ++s)
      for (auto t = 0; t < NUM_PRIZE_TIERS; ++t)
        hits[s][t] += other.hits[s][t];
  }

  // Returns the number of tickets of the specified strategy that won the specified tier.
  long long numHits(const TicketStrategy strategy, const PrizeTier tier) const {
    return hits[static_cast<int>(strategy)][static_cast<int>(tier)];
  }

  // Returns the number of winning tickets of the specified strategy, over all tiers.
  long long totalHits(const TicketStrategy strategy) const {
    long long total = 0;
    for (auto t = 1; t < NUM_PRIZE_TIERS; ++t)
      total += hits[static_cast<int>(strategy)][t];
    return total;
  }

  // Returns the fraction of winning tickets of the specified strategy.
  double hitRate(const TicketStrategy strategy) const {
    assert(numBetsPerStrategy > 0);
    return static_cast<double>(totalHits(strategy)) / numBetsPerStrategy;
  }

  std::array<std::array<long long, NUM_PRIZE_TIERS>, NUM_TICKET_STRATEGIES> hits;
  long long numBetsPerStrategy; // The number of tickets each strategy bought.
  int totalRunningTime;         // The total running time in milliseconds.
};
