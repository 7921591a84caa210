// Unit tests for the descriptive statistics over historical draws

#include <array>
#include <cassert>
#include <iostream>
#include <numeric>
#include <string>
#include <vector>

#include "Algorithms/Analysis/DrawAnalyzer.h"
#include "DataStructures/Lottery/DrawRecord.h"
#include "DataStructures/Lottery/Import/HistoricalDrawStore.h"
#include "DataStructures/Lottery/LotteryErrors.h"
#include "DataStructures/Lottery/NumberSet.h"
#include "Stats/Analysis/DrawStatistics.h"
#include "tests/TestHelpers.h"

namespace {

std::vector<DrawRecord> sampleDraws() {
  return {
    DrawRecord("2025001", "2025-01-02", NumberSet({1, 2, 3, 10, 20, 33}, 1)),
    DrawRecord("2025002", "2025-01-05", NumberSet({2, 4, 6, 8, 10, 12}, 2)),
    DrawRecord("2025003", "2025-01-07", NumberSet({5, 6, 7, 8, 9, 11}, 1)),
    DrawRecord("2025004", "2025-01-09", NumberSet({28, 29, 30, 31, 32, 33}, 16)),
  };
}

void testFrequencies() {
  std::cout << "Testing number frequencies... ";
  DrawAnalyzer analyzer;
  analyzer.run(sampleDraws());
  const auto& stats = analyzer.stats;
  assert(stats.numDraws == 4);
  assert(std::accumulate(stats.primaryFrequency.begin(), stats.primaryFrequency.end(), 0) == 24);
  assert(stats.primaryFrequency[2 - 1] == 2 && stats.primaryFrequency[33 - 1] == 2);
  assert(stats.primaryFrequency[1 - 1] == 1 && stats.primaryFrequency[13 - 1] == 0);
  assert(stats.secondaryFrequency[1 - 1] == 2 && stats.secondaryFrequency[16 - 1] == 1);

  // Equally frequent numbers are ranked by increasing number.
  const auto primary = stats.primaryRanking();
  assert(primary.size() == NUM_PRIMARY_NUMBERS);
  assert((std::vector<int>(primary.begin(), primary.begin() + 6) ==
          std::vector<int>{2, 6, 8, 10, 33, 1}));
  assert(primary.back() == 27);
  const auto secondary = stats.secondaryRanking();
  assert(secondary.size() == NUM_SECONDARY_NUMBERS);
  assert(secondary[0] == 1 && secondary[1] == 2 && secondary[2] == 16 && secondary[3] == 3);
  std::cout << "PASSED\n";
}

void testGapsAndRuns() {
  std::cout << "Testing gaps and consecutive numbers... ";
  DrawAnalyzer analyzer;
  analyzer.run(sampleDraws());
  const auto& stats = analyzer.stats;
  assert(stats.numGaps() == 20);
  assert(stats.gapFrequency[1] == 11);
  assert(stats.gapFrequency[2] == 6);
  assert(stats.gapFrequency[7] == 1 && stats.gapFrequency[10] == 1 && stats.gapFrequency[13] == 1);
  assert(std::accumulate(stats.gapFrequency.begin(), stats.gapFrequency.end(), 0) == 20);

  assert(stats.consecutiveFrequency[0] == 1);
  assert(stats.consecutiveFrequency[1] == 0);
  assert(stats.consecutiveFrequency[2] == 1);
  assert(stats.consecutiveFrequency[4] == 1);
  assert(stats.consecutiveFrequency[5] == 1);

  // The widest possible gap.
  analyzer.run({DrawRecord("1", "", NumberSet({1, 30, 31, 32, 33, 29}, 5))});
  assert(analyzer.stats.gapFrequency[MAX_PRIMARY_GAP] == 1);
  std::cout << "PASSED\n";
}

void testPatterns() {
  std::cout << "Testing odd/even splits and sums... ";
  DrawAnalyzer analyzer;
  analyzer.run(sampleDraws());
  const auto& stats = analyzer.stats;
  assert(stats.oddCountFrequency[0] == 1);
  assert(stats.oddCountFrequency[3] == 2);
  assert(stats.oddCountFrequency[4] == 1);
  assert(stats.numOddSecondary == 2);
  assert(stats.minSum == 42 && stats.maxSum == 183);
  assert(almostEqual(stats.meanSum, 85.0));
  assert(almostEqual(stats.medianSum, 57.5));

  // An odd number of draws has a middle sum.
  auto draws = sampleDraws();
  draws.pop_back();
  analyzer.run(draws);
  assert(almostEqual(analyzer.stats.medianSum, 46.0));
  assert(analyzer.stats.numDraws == 3);
  std::cout << "PASSED\n";
}

void testStoreInput() {
  std::cout << "Testing analysis of a draw store... ";
  const HistoricalDrawStore store(sampleDraws());
  DrawAnalyzer analyzer;
  analyzer.run(store.records());
  assert(analyzer.stats.numDraws == store.numRecords());
  assert(analyzer.stats.maxSum == 183);
  std::cout << "PASSED\n";
}

void testErrors() {
  std::cout << "Testing errors... ";
  assert(throwsException<EmptyDatasetError>([]() {
    DrawAnalyzer().run({});
  }));
  std::cout << "PASSED\n";
}

} // anonymous namespace

int main() {
  std::cout << "\n=== Draw Analyzer Tests ===\n\n";
  testFrequencies();
  testGapsAndRuns();
  testPatterns();
  testStoreInput();
  testErrors();
  std::cout << "\nAll tests passed!\n";
  return 0;
}
