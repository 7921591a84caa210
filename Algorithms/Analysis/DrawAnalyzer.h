#pragma once

#include <algorithm>
#include <vector>

#include "DataStructures/Lottery/DrawRecord.h"
#include "DataStructures/Lottery/LotteryErrors.h"
#include "Stats/Analysis/DrawStatistics.h"
#include "Tools/Constants.h"

// Computes descriptive statistics over a set of historical draws. The statistics are purely
// retrospective and have no predictive value.
class DrawAnalyzer {
 public:
  // Analyzes the specified draws.
  void run(const std::vector<DrawRecord>& draws) {
    if (draws.empty())
      throw EmptyDatasetError("no draws to analyze");
    stats.reset();
    stats.numDraws = draws.size();

    std::vector<int> sums;
    sums.reserve(draws.size());
    for (const auto& draw : draws) {
      const auto& numbers = draw.numbers;
      auto sum = 0;
      auto numOdd = 0;
      auto numConsecutive = 0;
      for (auto i = 0; i < NUM_PRIMARY_PICKS; ++i) {
        const auto number = numbers.primary[i];
        ++stats.primaryFrequency[number - 1];
        sum += number;
        numOdd += number % 2;
        if (i > 0) {
          const auto gap = number - numbers.primary[i - 1];
          ++stats.gapFrequency[gap];
          numConsecutive += gap == 1;
        }
      }
      ++stats.secondaryFrequency[numbers.secondary - 1];
      stats.numOddSecondary += numbers.secondary % 2;
      ++stats.consecutiveFrequency[numConsecutive];
      ++stats.oddCountFrequency[numOdd];
      sums.push_back(sum);
    }

    std::sort(sums.begin(), sums.end());
    const auto n = sums.size();
    stats.minSum = sums.front();
    stats.maxSum = sums.back();
    auto total = 0.0;
    for (const auto sum : sums)
      total += sum;
    stats.meanSum = total / n;
    stats.medianSum = n % 2 == 1 ? sums[n / 2] : (sums[n / 2 - 1] + sums[n / 2]) / 2.0;
  }

  DrawStatistics stats; // Statistics about the last analysis.
};
