#pragma once

#include <algorithm>
#include <array>
#include <cassert>
#include <fstream>
#include <istream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <csv.h>

#include "DataStructures/Lottery/DrawRecord.h"
#include "DataStructures/Lottery/LotteryErrors.h"
#include "DataStructures/Lottery/NumberSet.h"
#include "Tools/Constants.h"
#include "Tools/EnumParser.h"
#include "Tools/LexicalCast.h"
#include "Tools/StringHelpers.h"

// The header layouts of historical draw files.
enum class DrawFileFormat {
  CWL,   // The layout written by the welfare lottery scraper (Chinese column names).
  PLAIN, // English column names.
};

// Make EnumParser usable with DrawFileFormat.
template <>
inline void EnumParser<DrawFileFormat>::initNameToEnumMap() {
  nameToEnum = {
    {"cwl",   DrawFileFormat::CWL},
    {"plain", DrawFileFormat::PLAIN},
  };
}

// The collection of historical draws that all estimates of a run are based on. The records are
// loaded eagerly from a CSV file, validated, and never modified afterwards. When all period
// identifiers are numeric, the records are ordered by period; otherwise the input order is kept,
// which is expected to be most-recent-last.
class HistoricalDrawStore {
 public:
  // Loads the draws from the specified CSV file.
  explicit HistoricalDrawStore(const std::string& fileName,
                               const DrawFileFormat format = DrawFileFormat::CWL) {
    std::ifstream in(fileName);
    if (!in.good())
      throw std::invalid_argument("file not found -- '" + fileName + "'");
    load(fileName, in, format);
  }

  // Loads the draws from the specified stream. The source name is used in error messages.
  HistoricalDrawStore(const std::string& sourceName, std::istream& in,
                      const DrawFileFormat format = DrawFileFormat::CWL) {
    load(sourceName, in, format);
  }

  // Constructs a store from records that are already in memory.
  explicit HistoricalDrawStore(std::vector<DrawRecord> draws) : draws(std::move(draws)) {
    for (auto i = 0; i < this->draws.size(); ++i)
      validate(this->draws[i], "record " + std::to_string(i + 1));
    finishLoading();
  }

  // Returns the number of historical draws.
  int numRecords() const noexcept {
    return draws.size();
  }

  // Returns the historical draw with the specified index.
  const DrawRecord& operator[](const int idx) const {
    assert(idx >= 0); assert(idx < draws.size());
    return draws[idx];
  }

  // Returns all historical draws in chronological order.
  const std::vector<DrawRecord>& records() const noexcept {
    return draws;
  }

  // Returns the period following the most recent one, or the empty string if periods are not
  // numeric.
  std::string nextPeriod() const {
    if (!hasNumericPeriods)
      return "";
    const auto last = lexicalCast<long long>(draws.back().period);
    return std::to_string(last + 1);
  }

 private:
  // Reads all records from the specified stream.
  void load(const std::string& sourceName, std::istream& stream, const DrawFileFormat format) {
    using TrimPolicy = io::trim_chars<' ', '\t'>;
    using QuotePolicy = io::double_quote_escape<',', '"'>;
    using OverflowPolicy = io::throw_on_overflow;
    using CommentPolicy = io::single_line_comment<'#'>;
    using DrawReader = io::CSVReader<9, TrimPolicy, QuotePolicy, OverflowPolicy, CommentPolicy>;

    std::string period, date;
    std::array<int, NUM_PRIMARY_PICKS> primary;
    int secondary;
    try {
      DrawReader in(sourceName, stream);
      if (format == DrawFileFormat::CWL)
        in.read_header(
            io::ignore_extra_column, "期号", "开奖日期",
            "红球1", "红球2", "红球3", "红球4", "红球5", "红球6", "蓝球");
      else
        in.read_header(
            io::ignore_extra_column, "period", "date",
            "primary1", "primary2", "primary3", "primary4", "primary5", "primary6", "secondary");

      while (in.read_row(
          period, date,
          primary[0], primary[1], primary[2], primary[3], primary[4], primary[5], secondary)) {
        const auto where = "'" + sourceName + "' line " + std::to_string(in.get_file_line());
        if (period.empty())
          throw DataFormatError("malformed draw record in " + where + " -- missing period");
        draws.emplace_back(period, date, NumberSet(primary, secondary));
        validate(draws.back(), where);
      }
    } catch (io::error::base& e) {
      throw DataFormatError(std::string("malformed draw record -- ") + e.what());
    }
    finishLoading();
  }

  // Throws a DataFormatError if the specified record violates the rules of the lottery.
  static void validate(const DrawRecord& draw, const std::string& where) {
    const auto prefix = "malformed draw record in " + where + " (period " + draw.period + ") -- ";
    for (auto i = 0; i < NUM_PRIMARY_PICKS; ++i) {
      const auto number = draw.numbers.primary[i];
      if (number < 1 || number > NUM_PRIMARY_NUMBERS)
        throw DataFormatError(
            prefix + "primary number " + std::to_string(number) + " outside [1," +
            std::to_string(NUM_PRIMARY_NUMBERS) + "]");
      if (i > 0 && draw.numbers.primary[i - 1] == number)
        throw DataFormatError(prefix + "primary number " + std::to_string(number) + " repeated");
    }
    const auto secondary = draw.numbers.secondary;
    if (secondary < 1 || secondary > NUM_SECONDARY_NUMBERS)
      throw DataFormatError(
          prefix + "secondary number " + std::to_string(secondary) + " outside [1," +
          std::to_string(NUM_SECONDARY_NUMBERS) + "]");
    assert(draw.numbers.isValid());
  }

  // Orders the records chronologically and checks that the store is not empty.
  void finishLoading() {
    if (draws.empty())
      throw EmptyDatasetError("no historical draw records found");
    hasNumericPeriods = std::all_of(draws.begin(), draws.end(), [](const DrawRecord& draw) {
      return isDecimalNumber(draw.period);
    });
    if (hasNumericPeriods)
      std::stable_sort(draws.begin(), draws.end(), [](const DrawRecord& a, const DrawRecord& b) {
        return lexicalCast<long long>(a.period) < lexicalCast<long long>(b.period);
      });
  }

  std::vector<DrawRecord> draws; // The historical draws in chronological order.
  bool hasNumericPeriods;        // Indicates whether all period identifiers are numeric.
};
