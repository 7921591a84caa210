#pragma once

#include <algorithm>
#include <array>
#include <numeric>
#include <vector>

#include "Tools/Constants.h"

// The largest possible difference between two adjacent primary numbers of a draw.
constexpr int MAX_PRIMARY_GAP = NUM_PRIMARY_NUMBERS - NUM_PRIMARY_PICKS + 1;

// Descriptive statistics over a set of historical draws: how often each number was drawn, how
// the primary numbers of a draw are spread, and how their sum is distributed.
struct DrawStatistics {
  // Constructs an empty set of statistics.
  DrawStatistics() {
    reset();
  }

  // Resets all statistics to zero.
  void reset() {
    numDraws = 0;
    primaryFrequency.fill(0);
    secondaryFrequency.fill(0);
    gapFrequency.fill(0);
    consecutiveFrequency.fill(0);
    oddCountFrequency.fill(0);
    numOddSecondary = 0;
    minSum = 0;
    maxSum = 0;
    meanSum = 0;
    medianSum = 0;
  }

  // Returns the primary numbers ordered by decreasing frequency, ties broken in favor of the
  // smaller number.
  std::vector<int> primaryRanking() const {
    return ranking(primaryFrequency.begin(), primaryFrequency.end());
  }

  // Returns the secondary numbers ordered by decreasing frequency, ties broken in favor of the
  // smaller number.
  std::vector<int> secondaryRanking() const {
    return ranking(secondaryFrequency.begin(), secondaryFrequency.end());
  }

  // Returns the total number of gaps between adjacent primary numbers.
  int numGaps() const noexcept {
    return numDraws * (NUM_PRIMARY_PICKS - 1);
  }

  int numDraws; // The number of draws analyzed.

  std::array<int, NUM_PRIMARY_NUMBERS> primaryFrequency;     // Indexed by number - 1.
  std::array<int, NUM_SECONDARY_NUMBERS> secondaryFrequency; // Indexed by number - 1.

  // The number of times two adjacent primary numbers of a draw differ by g, indexed by g.
  std::array<int, MAX_PRIMARY_GAP + 1> gapFrequency;
  // The number of draws with k pairs of consecutive primary numbers, indexed by k.
  std::array<int, NUM_PRIMARY_PICKS> consecutiveFrequency;
  // The number of draws with k odd primary numbers, indexed by k.
  std::array<int, NUM_PRIMARY_PICKS + 1> oddCountFrequency;
  int numOddSecondary; // The number of draws with an odd secondary number.

  int minSum;       // The smallest sum of the primary numbers of a draw.
  int maxSum;       // The largest sum of the primary numbers of a draw.
  double meanSum;   // The mean sum of the primary numbers of a draw.
  double medianSum; // The median sum of the primary numbers of a draw.

 private:
  template <typename IteratorT>
  static std::vector<int> ranking(const IteratorT first, const IteratorT last) {
    std::vector<int> numbers(last - first);
    std::iota(numbers.begin(), numbers.end(), 1);
    std::stable_sort(numbers.begin(), numbers.end(), [&](const int a, const int b) {
      return first[a - 1] > first[b - 1];
    });
    return numbers;
  }
};
