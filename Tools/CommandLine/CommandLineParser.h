#pragma once

#include <algorithm>
#include <cctype>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "Tools/LexicalCast.h"

// A simple tool for obtaining command line options. An option consists of a name preceded by a
// single dash and zero or more values. A token starting with a dash followed by a digit or a
// decimal point is a (negative) value rather than an option name.
class CommandLineParser {
 public:
  // Constructs an uninitialized command line parser.
  CommandLineParser() = default;

  // Constructs a command line parser and parses the command line.
  CommandLineParser(int argc, char* argv[]) {
    parse(argc, argv);
  }

  // Parses the command line.
  void parse(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
      // Check if the current token is an option name.
      if (!isOptionName(argv[i]))
        throw std::invalid_argument("missing option name before '" + std::string(argv[i]) + "'");

      // The current option's name.
      std::string nm(&argv[i][1]);

      // Fetch the current option's value(s).
      options.erase(nm);
      for (; i + 1 < argc && !isOptionName(argv[i + 1]); ++i)
        options.emplace(nm, argv[i + 1]);

      if (options.count(nm) == 0)
        options.emplace(nm, "");
    }
  }

  // Returns true if the specified option is set on the command line.
  bool isSet(const std::string& nm) const {
    return options.count(nm) > 0;
  }

  // Throws std::invalid_argument if an option is set whose name is not among the specified ones.
  void checkOptionNames(const std::vector<std::string>& known) const {
    for (const auto& option : options)
      if (std::find(known.begin(), known.end(), option.first) == known.end())
        throw std::invalid_argument("unrecognized option -- '-" + option.first + "'");
  }

  // Returns the (first) value of the specified option, or dflt if the option is not set.
  template <typename T>
  T getValue(const std::string& nm, const T& dflt = T()) const {
    return isSet(nm) ? convert<T>(nm, options.lower_bound(nm)->second) : dflt;
  }

  // Returns a vector of all values of the specified option.
  template <typename T>
  std::vector<T> getValues(const std::string& nm) const {
    std::vector<T> values;
    for (auto iter = options.lower_bound(nm); iter != options.upper_bound(nm); ++iter)
      values.push_back(convert<T>(nm, iter->second));
    return values;
  }

 private:
  // Returns true if the specified token names an option.
  static bool isOptionName(const char* token) {
    if (token[0] != '-')
      return false;
    return !std::isdigit(static_cast<unsigned char>(token[1])) && token[1] != '.';
  }

  // Converts the specified value of the specified option to type T.
  template <typename T>
  static T convert(const std::string& nm, const std::string& val) {
    try {
      return lexicalCast<T>(val);
    } catch (std::out_of_range&) {
      throw std::out_of_range("value of option -" + nm + " is not representable -- '" + val + "'");
    } catch (std::invalid_argument&) {
      throw std::invalid_argument("invalid value of option -" + nm + " -- '" + val + "'");
    }
  }

  std::multimap<std::string, std::string> options; // The command line options as name/value pairs.
};
