#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

#include "Algorithms/Posterior/PosteriorEstimator.h"
#include "Algorithms/Simulation/PrizeJudge.h"
#include "Algorithms/Simulation/StrategySimulator.h"
#include "Algorithms/Simulation/TicketStrategies.h"
#include "DataStructures/Lottery/Import/HistoricalDrawStore.h"
#include "DataStructures/Lottery/PosteriorDistribution.h"
#include "Tools/CommandLine/CommandLineParser.h"
#include "Tools/EnumParser.h"
#include "Tools/OpenMP.h"
#include "Tools/StringHelpers.h"
#include "Tools/Timer.h"

inline void printUsage() {
  std::cout <<
      "Usage: SimulateStrategies [-n <num>] [-k <num>] [-s <seed>] [-i <file>] [-o <file>]\n"
      "Simulates uniformly random official draws and compares how often tickets picked by\n"
      "different strategies win a prize. No strategy is expected to beat random picks.\n"
      "  -n <num>          number of simulated draws (defaults to 100000)\n"
      "  -k <num>          tickets per strategy and draw (defaults to 1)\n"
      "  -s <seed>         start simulation with <seed> (defaults to 2025)\n"
      "  -i <file>         estimate the posterior strategy from historical draws in <file>\n"
      "                      (defaults to equal probabilities for all numbers)\n"
      "  -f <fmt>          header layout of the input file (defaults to cwl)\n"
      "                      possible values: cwl plain\n"
      "  -o <file>         place a per-strategy report in <file>\n"
      "  -v                display informative messages\n"
      "  -help             display this help and exit\n";
}

int main(int argc, char* argv[]) {
  try {
    CommandLineParser clp(argc, argv);
    if (clp.isSet("help")) {
      printUsage();
      return EXIT_SUCCESS;
    }

    clp.checkOptionNames({"help", "v", "n", "k", "s", "i", "f", "o"});

    // Parse the command-line options.
    const auto verbose = clp.isSet("v");
    const auto numDraws = clp.getValue<int>("n", 100000);
    const auto ticketsPerDraw = clp.getValue<int>("k", 1);
    const auto seed = clp.getValue<int>("s", 2025);
    const auto inputFileName = clp.getValue<std::string>("i");
    const auto fileFormat =
        EnumParser<DrawFileFormat>("file format")(clp.getValue<std::string>("f", "cwl"));
    auto outputFileName = clp.getValue<std::string>("o");
    if (!outputFileName.empty() && !endsWith(outputFileName, ".csv"))
      outputFileName += ".csv";

    // Validate command-line options.
    if (numDraws <= 0)
      throw std::invalid_argument("number of draws is no larger than 0");
    if (ticketsPerDraw <= 0)
      throw std::invalid_argument("number of tickets per draw is no larger than 0");
    if (seed < 0)
      throw std::invalid_argument("seed is smaller than 0");

    // Estimate the posterior that the posterior strategy draws from.
    auto posterior = PosteriorDistribution::uniform();
    if (!inputFileName.empty()) {
      Timer timer;
      if (verbose) std::cout << "Reading historical draws from file..." << std::flush;
      const HistoricalDrawStore store(inputFileName, fileFormat);
      posterior = PosteriorEstimator().estimate(store.records());
      if (verbose) std::cout << " done (" << timer.elapsed() << "ms).\n";
    }

    if (verbose) std::cout << "Running on " << omp_get_max_threads() << " thread(s).\n";
    StrategySimulator simulator(posterior, seed, verbose);
    simulator.run(numDraws, ticketsPerDraw);
    const auto& stats = simulator.stats;

    // Print a summary of all strategies.
    const EnumParser<TicketStrategy> strategyNames("strategy");
    std::cout << "Tickets per strategy: " << stats.numBetsPerStrategy << "\n";
    for (auto s = 0; s < NUM_TICKET_STRATEGIES; ++s) {
      const auto strategy = static_cast<TicketStrategy>(s);
      std::cout << "  " << std::left << std::setw(14) << strategyNames.nameOf(strategy)
                << std::right << std::setw(12) << stats.totalHits(strategy) << " wins  ("
                << std::fixed << std::setprecision(4) << 100 * stats.hitRate(strategy) << "%)\n";
    }

    // Write the per-strategy report.
    if (!outputFileName.empty()) {
      std::ofstream out(outputFileName);
      if (!out.good())
        throw std::invalid_argument("file cannot be opened -- '" + outputFileName + "'");
      const EnumParser<PrizeTier> tierNames("prize tier");
      out << "strategy,tickets";
      for (auto t = 0; t < NUM_PRIZE_TIERS; ++t)
        out << ',' << tierNames.nameOf(static_cast<PrizeTier>(t));
      out << ",wins,hit_rate\n";
      out << std::setprecision(8);
      for (auto s = 0; s < NUM_TICKET_STRATEGIES; ++s) {
        const auto strategy = static_cast<TicketStrategy>(s);
        out << strategyNames.nameOf(strategy) << ',' << stats.numBetsPerStrategy;
        for (auto t = 0; t < NUM_PRIZE_TIERS; ++t)
          out << ',' << stats.numHits(strategy, static_cast<PrizeTier>(t));
        out << ',' << stats.totalHits(strategy) << ',' << stats.hitRate(strategy) << '\n';
      }
      if (verbose) std::cout << "Report written to " << outputFileName << "\n";
    }
  } catch (std::exception& e) {
    std::cerr << argv[0] << ": " << e.what() << std::endl;
    std::cerr << "Try '" << argv[0] << " -help' for more information." << std::endl;
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
