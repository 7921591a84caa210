#pragma once

#include <string>

#include "DataStructures/Lottery/NumberSet.h"

// One historical drawing. The period and the date are opaque tokens taken from the input.
struct DrawRecord {
  // Constructs a draw record.
  DrawRecord(const std::string& period, const std::string& date, const NumberSet& numbers)
      : period(period), date(date), numbers(numbers) {}

  std::string period; // The period identifier, e.g. '2025114'.
  std::string date;   // The draw date as found in the input.
  NumberSet numbers;  // The numbers drawn.
};
