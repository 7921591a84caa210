#pragma once

#include <algorithm>
#include <cctype>
#include <limits>
#include <string>

// Tests if the specified string ends with the specified suffix.
inline bool endsWith(const std::string& string, const std::string& suffix) {
  return string.size() >= suffix.size() &&
      std::equal(suffix.rbegin(), suffix.rend(), string.rbegin());
}

// Tests if the specified string is a non-empty sequence of decimal digits whose value fits into a
// long long.
inline bool isDecimalNumber(const std::string& string) {
  if (string.empty() || string.size() > std::numeric_limits<long long>::digits10)
    return false;
  return std::all_of(string.begin(), string.end(), [](const unsigned char c) {
    return std::isdigit(c);
  });
}
