#pragma once

#include <stdexcept>
#include <string>

#include <csv.h>

// Converts the specified string to type T by the field parser of the CSV reader, so that values
// on the command line and fields in the input files follow the same syntax. Throws
// std::out_of_range if the value is not representable by T, and std::invalid_argument if the
// string is not a valid T at all.
template <typename T>
inline T lexicalCast(const std::string& string) {
  T val;
  try {
    io::detail::parse<io::throw_on_overflow>(const_cast<char*>(string.c_str()), val);
  } catch (io::error::integer_overflow&) {
    throw std::out_of_range("value is not representable -- '" + string + "'");
  } catch (io::error::integer_underflow&) {
    throw std::out_of_range("value is not representable -- '" + string + "'");
  } catch (io::error::base&) {
    throw std::invalid_argument("value cannot be converted -- '" + string + "'");
  }
  return val;
}
