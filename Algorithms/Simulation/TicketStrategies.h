#pragma once

#include <algorithm>
#include <array>
#include <vector>

#include "Algorithms/CandidateGeneration/CandidateGenerator.h"
#include "Algorithms/CandidateGeneration/WeightedSampler.h"
#include "DataStructures/Lottery/NumberSet.h"
#include "DataStructures/Lottery/PosteriorDistribution.h"
#include "Tools/Constants.h"
#include "Tools/EnumParser.h"

// The ticket-picking strategies compared by the strategy simulator.
enum class TicketStrategy {
  RANDOM,        // All numbers uniformly at random.
  POSTERIOR,     // Weighted by the posterior estimated from the draw history.
  ODD_EVEN,      // Three odd and three even primary numbers, uniformly at random.
  AVOID_POPULAR, // Uniformly at random, rejecting patterns that many players pick.
};

// The number of ticket-picking strategies.
constexpr int NUM_TICKET_STRATEGIES = 4;

// Make EnumParser usable with TicketStrategy.
template <>
inline void EnumParser<TicketStrategy>::initNameToEnumMap() {
  nameToEnum = {
    {"random",        TicketStrategy::RANDOM},
    {"posterior",     TicketStrategy::POSTERIOR},
    {"odd-even",      TicketStrategy::ODD_EVEN},
    {"avoid-popular", TicketStrategy::AVOID_POPULAR},
  };
}

// Picks tickets according to one of several strategies. None of them improves the odds of
// winning; they exist to demonstrate exactly that.
class TicketStrategies {
 public:
  // Constructs the strategies. The posterior strategy draws from the specified posterior.
  explicit TicketStrategies(const PosteriorDistribution& posterior)
      : posteriorGenerator(posterior),
        uniformPrimaryWeights(NUM_PRIMARY_NUMBERS, 1.0),
        uniformSecondaryWeights(NUM_SECONDARY_NUMBERS, 1.0),
        oddWeights((NUM_PRIMARY_NUMBERS + 1) / 2, 1.0),
        evenWeights(NUM_PRIMARY_NUMBERS / 2, 1.0) {}

  // Picks one ticket according to the specified strategy.
  NumberSet pick(const TicketStrategy strategy, WeightedSampler& sampler) const {
    switch (strategy) {
      case TicketStrategy::POSTERIOR:
        return posteriorGenerator.sample(sampler);
      case TicketStrategy::ODD_EVEN:
        return pickOddEven(sampler);
      case TicketStrategy::AVOID_POPULAR:
        while (true) {
          const auto ticket = pickUniform(sampler);
          if (!isPopularPattern(ticket))
            return ticket;
        }
      default:
        return pickUniform(sampler);
    }
  }

  // Returns a ticket drawn uniformly at random. This is also how official draws are simulated.
  NumberSet pickUniform(WeightedSampler& sampler) const {
    const auto drawn = sampler.drawWithoutReplacement(uniformPrimaryWeights, NUM_PRIMARY_PICKS);
    std::array<int, NUM_PRIMARY_PICKS> primary;
    for (auto i = 0; i < NUM_PRIMARY_PICKS; ++i)
      primary[i] = drawn[i] + 1;
    return NumberSet(primary, sampler.draw(uniformSecondaryWeights) + 1);
  }

  // Returns true if the specified ticket follows a pattern that many players pick: six
  // consecutive numbers, four or more numbers with the same last digit, or a span below eight.
  static bool isPopularPattern(const NumberSet& ticket) {
    const auto& primary = ticket.primary;
    if (primary.back() - primary.front() == NUM_PRIMARY_PICKS - 1)
      return true;
    std::array<int, 10> numWithLastDigit = {};
    for (const auto number : primary)
      if (++numWithLastDigit[number % 10] >= 4)
        return true;
    return primary.back() - primary.front() < 8;
  }

 private:
  // Returns a ticket with three odd and three even primary numbers.
  NumberSet pickOddEven(WeightedSampler& sampler) const {
    const auto odd = sampler.drawWithoutReplacement(oddWeights, NUM_PRIMARY_PICKS / 2);
    const auto even = sampler.drawWithoutReplacement(evenWeights, NUM_PRIMARY_PICKS / 2);
    std::array<int, NUM_PRIMARY_PICKS> primary;
    for (auto i = 0; i < NUM_PRIMARY_PICKS / 2; ++i) {
      primary[i] = 2 * odd[i] + 1;
      primary[NUM_PRIMARY_PICKS / 2 + i] = 2 * even[i] + 2;
    }
    return NumberSet(primary, sampler.draw(uniformSecondaryWeights) + 1);
  }

  CandidateGenerator posteriorGenerator;       // Draws tickets from the posterior.
  std::vector<double> uniformPrimaryWeights;   // Equal weights for all primary numbers.
  std::vector<double> uniformSecondaryWeights; // Equal weights for all secondary numbers.
  std::vector<double> oddWeights;              // Equal weights for all odd primary numbers.
  std::vector<double> evenWeights;             // Equal weights for all even primary numbers.
};
