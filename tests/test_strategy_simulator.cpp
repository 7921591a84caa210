// Unit tests for prize judging, ticket strategies and the strategy simulator

#include <cassert>
#include <iostream>
#include <stdexcept>

#include "Algorithms/CandidateGeneration/WeightedSampler.h"
#include "Algorithms/Simulation/PrizeJudge.h"
#include "Algorithms/Simulation/StrategySimulator.h"
#include "Algorithms/Simulation/TicketStrategies.h"
#include "DataStructures/Lottery/NumberSet.h"
#include "DataStructures/Lottery/PosteriorDistribution.h"
#include "Tools/EnumParser.h"
#include "Tools/OpenMP.h"
#include "tests/TestHelpers.h"

namespace {

void testPrizeTiers() {
  std::cout << "Testing prize tiers... ";
  const NumberSet draw({1, 2, 3, 4, 5, 6}, 7);
  assert(judgePrize(NumberSet({1, 2, 3, 4, 5, 6}, 7), draw) == PrizeTier::FIRST);
  assert(judgePrize(NumberSet({1, 2, 3, 4, 5, 6}, 8), draw) == PrizeTier::SECOND);
  assert(judgePrize(NumberSet({1, 2, 3, 4, 5, 33}, 7), draw) == PrizeTier::THIRD);
  assert(judgePrize(NumberSet({1, 2, 3, 4, 5, 33}, 8), draw) == PrizeTier::FOURTH);
  assert(judgePrize(NumberSet({1, 2, 3, 4, 32, 33}, 7), draw) == PrizeTier::FOURTH);
  assert(judgePrize(NumberSet({1, 2, 3, 4, 32, 33}, 8), draw) == PrizeTier::FIFTH);
  assert(judgePrize(NumberSet({1, 2, 3, 31, 32, 33}, 7), draw) == PrizeTier::FIFTH);
  assert(judgePrize(NumberSet({1, 2, 3, 31, 32, 33}, 8), draw) == PrizeTier::NONE);
  assert(judgePrize(NumberSet({1, 2, 30, 31, 32, 33}, 7), draw) == PrizeTier::SIXTH);
  assert(judgePrize(NumberSet({28, 29, 30, 31, 32, 33}, 7), draw) == PrizeTier::SIXTH);
  assert(judgePrize(NumberSet({28, 29, 30, 31, 32, 33}, 8), draw) == PrizeTier::NONE);
  assert(EnumParser<PrizeTier>().nameOf(PrizeTier::THIRD) == "third");
  std::cout << "PASSED\n";
}

void testPopularPatterns() {
  std::cout << "Testing popular patterns... ";
  assert(TicketStrategies::isPopularPattern(NumberSet({7, 8, 9, 10, 11, 12}, 1)));
  assert(TicketStrategies::isPopularPattern(NumberSet({1, 11, 21, 31, 5, 17}, 1)));
  assert(TicketStrategies::isPopularPattern(NumberSet({1, 2, 4, 5, 6, 8}, 1)));
  assert(!TicketStrategies::isPopularPattern(NumberSet({3, 8, 11, 20, 27, 31}, 1)));
  std::cout << "PASSED\n";
}

void testStrategies() {
  std::cout << "Testing ticket strategies... ";
  const auto posterior = linearPosterior();
  const TicketStrategies strategies(posterior);
  const EnumParser<TicketStrategy> parseStrategy("strategy");
  WeightedSampler sampler(3);
  for (auto i = 0; i < 200; ++i) {
    for (const auto name : {"random", "posterior", "odd-even", "avoid-popular"}) {
      const auto ticket = strategies.pick(parseStrategy(name), sampler);
      assert(ticket.isValid());
    }

    auto numOdd = 0;
    for (const auto number : strategies.pick(TicketStrategy::ODD_EVEN, sampler).primary)
      numOdd += number % 2;
    assert(numOdd == 3);

    const auto ticket = strategies.pick(TicketStrategy::AVOID_POPULAR, sampler);
    assert(!TicketStrategies::isPopularPattern(ticket));
  }
  std::cout << "PASSED\n";
}

void testReproducibility() {
  std::cout << "Testing reproducibility of simulation... ";
  const auto posterior = PosteriorDistribution::uniform();
  StrategySimulator first(posterior, 17, false);
  first.run(10000, 2);
  StrategySimulator second(posterior, 17, false);
  second.run(10000, 2);
  for (auto s = 0; s < NUM_TICKET_STRATEGIES; ++s)
    for (auto t = 0; t < NUM_PRIZE_TIERS; ++t) {
      const auto strategy = static_cast<TicketStrategy>(s);
      const auto tier = static_cast<PrizeTier>(t);
      assert(first.stats.numHits(strategy, tier) == second.stats.numHits(strategy, tier));
    }

#ifdef _OPENMP
  // The outcome does not depend on the number of threads.
  const auto numThreads = omp_get_max_threads();
  omp_set_num_threads(1);
  StrategySimulator sequential(posterior, 17, false);
  sequential.run(10000, 2);
  omp_set_num_threads(numThreads);
  for (auto s = 0; s < NUM_TICKET_STRATEGIES; ++s) {
    const auto strategy = static_cast<TicketStrategy>(s);
    assert(sequential.stats.totalHits(strategy) == first.stats.totalHits(strategy));
  }
#endif
  std::cout << "PASSED\n";
}

void testHitRates() {
  std::cout << "Testing hit rates... ";
  const auto posterior = linearPosterior();
  StrategySimulator simulator(posterior, 2025, false);
  simulator.run(20000, 1);
  const auto& stats = simulator.stats;
  assert(stats.numBetsPerStrategy == 20000);
  for (auto s = 0; s < NUM_TICKET_STRATEGIES; ++s) {
    const auto strategy = static_cast<TicketStrategy>(s);
    auto total = 0ll;
    for (auto t = 0; t < NUM_PRIZE_TIERS; ++t)
      total += stats.numHits(strategy, static_cast<PrizeTier>(t));
    assert(total == stats.numBetsPerStrategy);
    // About 6.7% of all tickets win some prize, whatever the strategy.
    assert(stats.hitRate(strategy) > 0.05 && stats.hitRate(strategy) < 0.085);
  }
  std::cout << "PASSED\n";
}

void testErrors() {
  std::cout << "Testing errors... ";
  const auto posterior = PosteriorDistribution::uniform();
  assert(throwsException<std::invalid_argument>([&]() {
    StrategySimulator simulator(posterior, -1, false);
  }));
  assert(throwsException<std::invalid_argument>([&]() {
    StrategySimulator(posterior, 1, false).run(0, 1);
  }));
  assert(throwsException<std::invalid_argument>([&]() {
    StrategySimulator(posterior, 1, false).run(10, 0);
  }));
  assert(throwsException<std::invalid_argument>([]() {
    EnumParser<TicketStrategy>("strategy")("lucky");
  }));
  std::cout << "PASSED\n";
}

} // anonymous namespace

int main() {
  std::cout << "\n=== Strategy Simulator Tests ===\n\n";
  testPrizeTiers();
  testPopularPatterns();
  testStrategies();
  testReproducibility();
  testHitRates();
  testErrors();
  std::cout << "\nAll tests passed!\n";
  return 0;
}
