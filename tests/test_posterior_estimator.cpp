// Unit tests for the posterior estimation

#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "Algorithms/Posterior/PosteriorEstimator.h"
#include "DataStructures/Lottery/DrawRecord.h"
#include "DataStructures/Lottery/LotteryErrors.h"
#include "DataStructures/Lottery/NumberSet.h"
#include "DataStructures/Lottery/PosteriorDistribution.h"
#include "tests/TestHelpers.h"

namespace {

std::vector<DrawRecord> sampleHistory() {
  std::vector<DrawRecord> draws;
  draws.emplace_back("1", "", NumberSet({1, 2, 3, 4, 5, 6}, 1));
  draws.emplace_back("2", "", NumberSet({1, 2, 3, 7, 8, 9}, 1));
  draws.emplace_back("3", "", NumberSet({1, 10, 11, 12, 13, 14}, 2));
  return draws;
}

double sum(const std::vector<double>& values) {
  auto total = 0.0;
  for (const auto value : values)
    total += value;
  return total;
}

void testNormalizationAndPositivity() {
  std::cout << "Testing normalization and positivity... ";
  for (const auto alpha : {0.01, 0.5, 1.0, 3.0}) {
    EstimatorParams params;
    params.alphaPrimary = alpha;
    params.alphaSecondary = alpha;
    const auto posterior = PosteriorEstimator(params).estimate(sampleHistory());
    assert(almostEqual(sum(posterior.primaryProbabilities()), 1.0));
    assert(almostEqual(sum(posterior.secondaryProbabilities()), 1.0));
    for (const auto p : posterior.primaryProbabilities())
      assert(p > 0);
    for (const auto q : posterior.secondaryProbabilities())
      assert(q > 0);
  }
  std::cout << "PASSED\n";
}

void testSmoothedValues() {
  std::cout << "Testing smoothed values... ";
  const auto posterior = PosteriorEstimator().estimate(sampleHistory());
  // 18 primary appearances, 33 numbers, alpha 1.
  assert(almostEqual(posterior.primary(1), 4.0 / 51));
  assert(almostEqual(posterior.primary(2), 3.0 / 51));
  assert(almostEqual(posterior.primary(14), 2.0 / 51));
  assert(almostEqual(posterior.primary(33), 1.0 / 51));
  // 3 secondary appearances, 16 numbers, alpha 1.
  assert(almostEqual(posterior.secondary(1), 3.0 / 19));
  assert(almostEqual(posterior.secondary(2), 2.0 / 19));
  assert(almostEqual(posterior.secondary(16), 1.0 / 19));
  std::cout << "PASSED\n";
}

void testSeparateAlphas() {
  std::cout << "Testing separate smoothing constants... ";
  EstimatorParams params;
  params.alphaPrimary = 2.0;
  params.alphaSecondary = 0.5;
  const auto posterior = PosteriorEstimator(params).estimate(sampleHistory());
  assert(almostEqual(posterior.primary(1), 5.0 / 84));
  assert(almostEqual(posterior.secondary(1), 2.5 / 11));
  std::cout << "PASSED\n";
}

void testFromCounts() {
  std::cout << "Testing estimation from counts... ";
  const auto posterior = linearPosterior();
  assert(almostEqual(posterior.primary(1), 2.0 / 594));
  assert(almostEqual(posterior.primary(33), 34.0 / 594));
  assert(almostEqual(posterior.secondary(16), 17.0 / 152));
  const auto uniform = PosteriorDistribution::uniform();
  assert(almostEqual(uniform.primary(7), 1.0 / 33));
  assert(almostEqual(uniform.secondary(7), 1.0 / 16));
  std::cout << "PASSED\n";
}

void testRecentWindow() {
  std::cout << "Testing recent window... ";
  EstimatorParams params;
  params.recent = 1;
  const auto posterior = PosteriorEstimator(params).estimate(sampleHistory());
  // Only the last draw is used: 6 appearances, secondary number 2.
  assert(almostEqual(posterior.primary(1), 2.0 / 39));
  assert(almostEqual(posterior.primary(2), 1.0 / 39));
  assert(almostEqual(posterior.secondary(2), 2.0 / 17));
  assert(almostEqual(posterior.secondary(1), 1.0 / 17));

  // A window larger than the history uses all draws.
  params.recent = 100;
  const auto all = PosteriorEstimator(params).estimate(sampleHistory());
  assert(almostEqual(all.primary(1), 4.0 / 51));
  std::cout << "PASSED\n";
}

void testTimeDecay() {
  std::cout << "Testing time decay... ";
  EstimatorParams params;
  params.decay = 0.5;
  const auto posterior = PosteriorEstimator(params).estimate(sampleHistory());
  // Weights 0.25, 0.5 and 1 from the oldest to the newest draw.
  const auto total = 6 * (0.25 + 0.5 + 1.0) + 33;
  assert(almostEqual(posterior.primary(1), (1.75 + 1) / total));
  assert(almostEqual(posterior.primary(4), (0.25 + 1) / total));
  assert(almostEqual(posterior.primary(10), (1.0 + 1) / total));
  assert(posterior.primary(10) > posterior.primary(7));
  assert(posterior.primary(7) > posterior.primary(4));
  assert(almostEqual(sum(posterior.primaryProbabilities()), 1.0));
  std::cout << "PASSED\n";
}

void testErrors() {
  std::cout << "Testing errors... ";
  assert(throwsException<EmptyDatasetError>([]() {
    PosteriorEstimator().estimate({});
  }));
  const auto withParams = [](const double alpha, const int recent, const double decay) {
    return [=]() {
      EstimatorParams params;
      params.alphaPrimary = alpha;
      params.recent = recent;
      params.decay = decay;
      PosteriorEstimator estimator(params);
    };
  };
  assert(throwsException<std::invalid_argument>(withParams(0.0, 0, 1.0)));
  assert(throwsException<std::invalid_argument>(withParams(-1.0, 0, 1.0)));
  assert(throwsException<std::invalid_argument>(withParams(1.0, -1, 1.0)));
  assert(throwsException<std::invalid_argument>(withParams(1.0, 0, 0.0)));
  assert(throwsException<std::invalid_argument>(withParams(1.0, 0, 1.5)));
  assert(!throwsException<std::invalid_argument>(withParams(1.0, 10, 0.9)));
  std::cout << "PASSED\n";
}

} // anonymous namespace

int main() {
  std::cout << "\n=== Posterior Estimator Tests ===\n\n";
  testNormalizationAndPositivity();
  testSmoothedValues();
  testSeparateAlphas();
  testFromCounts();
  testRecentWindow();
  testTimeDecay();
  testErrors();
  std::cout << "\nAll tests passed!\n";
  return 0;
}
