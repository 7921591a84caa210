#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

#include "Algorithms/Suggestion/PresetConfig.h"
#include "Algorithms/Suggestion/RunConfig.h"
#include "Algorithms/Suggestion/SelectionLog.h"
#include "Algorithms/Suggestion/SuggestionPipeline.h"
#include "DataStructures/Lottery/Candidate.h"
#include "DataStructures/Lottery/Import/HistoricalDrawStore.h"
#include "DataStructures/Lottery/SelectionResult.h"
#include "Tools/CommandLine/CommandLineParser.h"
#include "Tools/Constants.h"
#include "Tools/EnumParser.h"
#include "Tools/Logging/LogManager.h"
#include "Tools/Logging/NullLogger.h"
#include "Tools/StringHelpers.h"
#include "Tools/Timer.h"

inline void printUsage() {
  std::cout <<
      "Usage: SuggestNumbers -i <file> [-m <mode>] [-n <num>] [-s <seed>] [-p <preset>]\n"
      "Suggests plays for a 6-of-33 plus 1-of-16 lottery. Estimates smoothed number frequencies\n"
      "from historical draws, builds the most likely play and a set of sampled plays, and selects\n"
      "a winner among them by iterated elimination that penalizes overlap between plays.\n"
      "  -i <file>         historical draws in CSV format\n"
      "  -f <fmt>          header layout of the input file (defaults to cwl)\n"
      "                      possible values: cwl plain\n"
      "  -m <mode>         emit only the top play, or sampled plays as well (defaults to sample)\n"
      "                      possible values: top sample\n"
      "  -n <num>          number of sampled plays (defaults to 6)\n"
      "  -s <seed>         start sampling with <seed> (defaults to 42)\n"
      "  -p <preset>       use the parameters of <preset> (defaults to default)\n"
      "                      possible values: default balanced dedup hot\n"
      "  -beta <real>      weight of the overlap penalty (overrides the preset)\n"
      "  -t <real>         sampling temperature (overrides the preset)\n"
      "  -recent <num>     estimate from the <num> most recent draws only (0 means all)\n"
      "  -decay <real>     weight a draw k draws back by <real>^k (overrides the preset)\n"
      "  -ap <real>        smoothing pseudo-count of the primary pool (defaults to 1)\n"
      "  -as <real>        smoothing pseudo-count of the secondary pool (defaults to 1)\n"
      "  -no-select        do not select a winner among the plays\n"
      "  -l <file>         write the elimination rounds to <file>.rebargain.csv\n"
      "  -v                display informative messages on stderr\n"
      "  -help             display this help and exit\n";
}

// Writes one output line for the specified candidate.
inline void printCandidate(const Candidate& candidate) {
  std::cout << candidate.tag() << ": " << candidate.numbers << '\n';
}

int main(int argc, char* argv[]) {
  try {
    CommandLineParser clp(argc, argv);
    if (clp.isSet("help")) {
      printUsage();
      return EXIT_SUCCESS;
    }

    clp.checkOptionNames({
        "help", "v", "i", "f", "m", "n", "s", "p",
        "beta", "t", "recent", "decay", "ap", "as", "no-select", "l"});

    // Parse the command-line options. A preset is applied first and explicit options override it.
    const auto verbose = clp.isSet("v");
    const auto inputFileName = clp.getValue<std::string>("i");
    const auto fileFormat =
        EnumParser<DrawFileFormat>("file format")(clp.getValue<std::string>("f", "cwl"));
    const auto logFileStem = clp.getValue<std::string>("l");

    RunConfig config;
    config.applyPreset(EnumParser<Preset>("preset")(clp.getValue<std::string>("p", "default")));
    config.mode = EnumParser<SuggestionMode>("mode")(clp.getValue<std::string>("m", "sample"));
    config.numSamples = clp.getValue<int>("n", DEFAULT_NUM_SAMPLES);
    config.seed = clp.getValue<long long>("s", DEFAULT_SEED);
    config.runSelector = !clp.isSet("no-select");
    config.beta = clp.getValue<double>("beta", config.beta);
    config.temperature = clp.getValue<double>("t", config.temperature);
    config.estimator.recent = clp.getValue<int>("recent", config.estimator.recent);
    config.estimator.decay = clp.getValue<double>("decay", config.estimator.decay);
    config.estimator.alphaPrimary = clp.getValue<double>("ap", DEFAULT_ALPHA);
    config.estimator.alphaSecondary = clp.getValue<double>("as", DEFAULT_ALPHA);

    // Validate command-line options.
    if (inputFileName.empty())
      throw std::invalid_argument("no input file given");
    if (!logFileStem.empty() && endsWith(logFileStem, "/"))
      throw std::invalid_argument("log file name is a directory -- '" + logFileStem + "'");
    config.validate();

    // Read the historical draws from file.
    Timer timer;
    if (verbose) std::cerr << "Reading historical draws from file..." << std::flush;
    const HistoricalDrawStore store(inputFileName, fileFormat);
    if (verbose) {
      std::cerr << " done (" << timer.lap() << "ms).\n";
      std::cerr << "  Draws: " << store.numRecords() << "\n";
      if (!store.nextPeriod().empty())
        std::cerr << "  Next period: " << store.nextPeriod() << "\n";
    }

    // Run the pipeline.
    if (verbose) std::cerr << "Suggesting numbers..." << std::flush;
    const auto result = suggestNumbers(store, config);
    if (verbose) {
      std::cerr << " done (" << timer.lap() << "ms).\n";
      if (result.hasWinner)
        std::cerr << "  Selection rounds: " << result.history.numRounds() << "\n";
    }

    // Write the selection log.
    if (result.hasWinner) {
      if (logFileStem.empty()) {
        writeSelectionLog<NullLogger>(result);
      } else {
        LogManager<std::ofstream>::setBaseFileName(logFileStem);
        writeSelectionLog<std::ofstream>(result);
        if (verbose)
          std::cerr << "Selection log written to " << logFileStem << ".rebargain.csv\n";
      }
    }

    // Write the plays in their fixed order: top, samples, winner.
    printCandidate(result.top);
    for (const auto& sample : result.samples)
      printCandidate(sample);
    if (result.hasWinner)
      std::cout << "winner: " << result.winner.numbers << " (" << result.winner.tag()
                << ", score " << std::fixed << std::setprecision(4) << result.winnerScore << ")\n";
    std::cout << std::flush;
  } catch (std::exception& e) {
    std::cerr << argv[0] << ": " << e.what() << std::endl;
    std::cerr << "Try '" << argv[0] << " -help' for more information." << std::endl;
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
