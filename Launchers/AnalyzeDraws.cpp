#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "Algorithms/Analysis/DrawAnalyzer.h"
#include "DataStructures/Lottery/Import/HistoricalDrawStore.h"
#include "Stats/Analysis/DrawStatistics.h"
#include "Tools/CommandLine/CommandLineParser.h"
#include "Tools/Constants.h"
#include "Tools/EnumParser.h"
#include "Tools/StringHelpers.h"
#include "Tools/Timer.h"

inline void printUsage() {
  std::cout <<
      "Usage: AnalyzeDraws -i <file> [-f <fmt>] [-k <num>] [-o <file>]\n"
      "Computes descriptive statistics over historical draws: number frequencies, gaps and runs\n"
      "of consecutive primary numbers, odd/even splits and the distribution of the primary sums.\n"
      "  -i <file>         historical draws in CSV format\n"
      "  -f <fmt>          header layout of the input file (defaults to cwl)\n"
      "                      possible values: cwl plain\n"
      "  -k <num>          list the <num> hottest and coldest primary numbers (defaults to 10)\n"
      "  -o <file>         place the frequency of every number in <file>\n"
      "  -v                display informative messages\n"
      "  -help             display this help and exit\n";
}

// Prints a frequency table row with its share of the specified total.
inline void printRow(const std::string& label, const int count, const int total) {
  std::cout << "  " << std::left << std::setw(14) << label << std::right << std::setw(8) << count
            << "  (" << std::fixed << std::setprecision(2) << 100.0 * count / total << "%)\n";
}

// Prints the first k numbers of the specified ranking together with their frequencies.
inline void printRanking(const std::vector<int>& numbers, const int k,
                         const int* const frequency, const int total) {
  for (auto i = 0; i < k; ++i)
    printRow(std::to_string(numbers[i]), frequency[numbers[i] - 1], total);
}

int main(int argc, char* argv[]) {
  try {
    CommandLineParser clp(argc, argv);
    if (clp.isSet("help")) {
      printUsage();
      return EXIT_SUCCESS;
    }

    clp.checkOptionNames({"help", "v", "i", "f", "k", "o"});

    // Parse the command-line options.
    const auto verbose = clp.isSet("v");
    const auto inputFileName = clp.getValue<std::string>("i");
    const auto fileFormat =
        EnumParser<DrawFileFormat>("file format")(clp.getValue<std::string>("f", "cwl"));
    const auto k = clp.getValue<int>("k", 10);
    auto outputFileName = clp.getValue<std::string>("o");
    if (!outputFileName.empty() && !endsWith(outputFileName, ".csv"))
      outputFileName += ".csv";

    // Validate command-line options.
    if (inputFileName.empty())
      throw std::invalid_argument("no input file given");
    if (k <= 0)
      throw std::invalid_argument("length of the hot and cold lists is no larger than 0");

    Timer timer;
    if (verbose) std::cout << "Reading historical draws from file..." << std::flush;
    const HistoricalDrawStore store(inputFileName, fileFormat);
    if (verbose) std::cout << " done (" << timer.lap() << "ms).\n";

    DrawAnalyzer analyzer;
    analyzer.run(store.records());
    const auto& stats = analyzer.stats;
    const auto numPrimary = stats.numDraws * NUM_PRIMARY_PICKS;
    const auto listLength = std::min(k, NUM_PRIMARY_NUMBERS);

    std::cout << "Draws: " << stats.numDraws << "\n";

    auto ranking = stats.primaryRanking();
    std::cout << "\nHottest primary numbers:\n";
    printRanking(ranking, listLength, stats.primaryFrequency.data(), numPrimary);
    std::cout << "\nColdest primary numbers:\n";
    std::reverse(ranking.begin(), ranking.end());
    printRanking(ranking, listLength, stats.primaryFrequency.data(), numPrimary);
    std::cout << "\nSecondary numbers:\n";
    printRanking(stats.secondaryRanking(), NUM_SECONDARY_NUMBERS,
                 stats.secondaryFrequency.data(), stats.numDraws);

    std::cout << "\nGaps between adjacent primary numbers:\n";
    for (auto g = 1; g <= MAX_PRIMARY_GAP; ++g)
      if (stats.gapFrequency[g] > 0)
        printRow("gap " + std::to_string(g), stats.gapFrequency[g], stats.numGaps());
    std::cout << "\nPairs of consecutive primary numbers:\n";
    for (auto c = 0; c < NUM_PRIMARY_PICKS; ++c)
      if (stats.consecutiveFrequency[c] > 0)
        printRow(std::to_string(c) + " pair(s)", stats.consecutiveFrequency[c], stats.numDraws);

    std::cout << "\nOdd/even split of the primary numbers:\n";
    for (auto o = NUM_PRIMARY_PICKS; o >= 0; --o)
      if (stats.oddCountFrequency[o] > 0)
        printRow(std::to_string(o) + " odd " + std::to_string(NUM_PRIMARY_PICKS - o) + " even",
                 stats.oddCountFrequency[o], stats.numDraws);
    std::cout << "\nOdd secondary numbers:\n";
    printRow("odd", stats.numOddSecondary, stats.numDraws);
    printRow("even", stats.numDraws - stats.numOddSecondary, stats.numDraws);

    std::cout << "\nSum of the primary numbers:\n";
    std::cout << "  min " << stats.minSum << ", max " << stats.maxSum << ", mean "
              << std::fixed << std::setprecision(2) << stats.meanSum << ", median "
              << stats.medianSum << "\n";

    // Write the frequency of every number.
    if (!outputFileName.empty()) {
      std::ofstream out(outputFileName);
      if (!out.good())
        throw std::invalid_argument("file cannot be opened -- '" + outputFileName + "'");
      out << "pool,number,count\n";
      for (auto n = 1; n <= NUM_PRIMARY_NUMBERS; ++n)
        out << "primary," << n << ',' << stats.primaryFrequency[n - 1] << '\n';
      for (auto n = 1; n <= NUM_SECONDARY_NUMBERS; ++n)
        out << "secondary," << n << ',' << stats.secondaryFrequency[n - 1] << '\n';
      if (verbose) std::cout << "Frequencies written to " << outputFileName << "\n";
    }
  } catch (std::exception& e) {
    std::cerr << argv[0] << ": " << e.what() << std::endl;
    std::cerr << "Try '" << argv[0] << " -help' for more information." << std::endl;
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
