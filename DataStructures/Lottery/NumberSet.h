#pragma once

#include <algorithm>
#include <array>
#include <cassert>
#include <iomanip>
#include <ostream>

#include <boost/dynamic_bitset.hpp>

#include "Tools/Constants.h"

// One complete play: six distinct primary numbers and one secondary number. The primary numbers
// are kept in ascending order.
struct NumberSet {
  // Constructs an invalid number set.
  NumberSet() : secondary(0) {
    primary.fill(0);
  }

  // Constructs a number set from the specified numbers. The primary numbers need not be sorted.
  NumberSet(const std::array<int, NUM_PRIMARY_PICKS>& primaryNumbers, const int secondaryNumber)
      : primary(primaryNumbers), secondary(secondaryNumber) {
    std::sort(primary.begin(), primary.end());
  }

  // Returns true if all numbers lie within their pools and the primary numbers are distinct.
  bool isValid() const {
    for (auto i = 0; i < NUM_PRIMARY_PICKS; ++i) {
      if (primary[i] < 1 || primary[i] > NUM_PRIMARY_NUMBERS)
        return false;
      if (i > 0 && primary[i - 1] >= primary[i])
        return false;
    }
    return 1 <= secondary && secondary <= NUM_SECONDARY_NUMBERS;
  }

  // Returns the primary numbers as a bitset indexed by number.
  boost::dynamic_bitset<> primaryMask() const {
    boost::dynamic_bitset<> mask(NUM_PRIMARY_NUMBERS + 1);
    for (const auto number : primary) {
      assert(number >= 1); assert(number <= NUM_PRIMARY_NUMBERS);
      mask[number] = true;
    }
    return mask;
  }

  // Returns the number of primary numbers this set shares with the specified one.
  int numCommonPrimary(const NumberSet& other) const {
    return (primaryMask() & other.primaryMask()).count();
  }

  bool operator==(const NumberSet& rhs) const {
    return primary == rhs.primary && secondary == rhs.secondary;
  }

  bool operator!=(const NumberSet& rhs) const {
    return !(*this == rhs);
  }

  std::array<int, NUM_PRIMARY_PICKS> primary; // The primary numbers in ascending order.
  int secondary;                              // The secondary number.
};

// Writes a number set in the form '03 08 11 20 27 31 | 09'.
inline std::ostream& operator<<(std::ostream& os, const NumberSet& set) {
  const auto fill = os.fill('0');
  for (const auto number : set.primary)
    os << std::setw(2) << number << ' ';
  os << "| " << std::setw(2) << set.secondary;
  os.fill(fill);
  return os;
}
