#pragma once

#include <cassert>
#include <iostream>
#include <ostream>

#include "Tools/OpenMP.h"

// A textual indicator of progress towards some goal. It may be advanced from within a parallel
// region, in which case only the master thread prints.
class ProgressBar {
 public:
  // Constructs a progress bar with the specified number of steps.
  explicit ProgressBar(const int numSteps, const bool verbose = true, std::ostream& os = std::cout)
      : os(os), numSteps(numSteps), stepsDone(0), percentageDone(0), verbose(verbose) {
    assert(numSteps > 0);
    if (verbose)
      os << "0% " << std::flush;
  }

  // Advances the progress bar to 100 %.
  void finish() {
    if (!verbose)
      return;
    stepsDone = numSteps;
    print(100);
  }

  // Advances the progress bar by one step.
  void operator++() {
    if (!verbose)
      return;
    int done;
    #pragma omp atomic capture
    done = ++stepsDone;
    if (omp_get_thread_num() == 0)
      print(done * 100l / numSteps);
  }

 private:
  static constexpr int PERCENTAGE_OUTPUT_INTERVAL = 20; // Points between two printed percentages.
  static constexpr int DOT_OUTPUT_INTERVAL = 5;         // Points between two printed dots.

  // Prints the progress bar until the specified percentage.
  void print(const int until) {
    assert(until <= 100);
    for (int i = percentageDone + 1; i <= until; ++i)
      if (i % PERCENTAGE_OUTPUT_INTERVAL == 0)
        os << " " << i << "% " << std::flush;
      else if (i % DOT_OUTPUT_INTERVAL == 0)
        os << "." << std::flush;
    if (until > percentageDone)
      percentageDone = until;
  }

  std::ostream& os; // The output stream the progress bar is printed to.

  const int numSteps; // The number of steps that have to be done.
  int stepsDone;      // The number of steps that have already been done.
  int percentageDone; // The percentage that has already been printed.
  const bool verbose; // Indicates if the progress bar should be printed.
};
