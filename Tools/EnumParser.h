#pragma once

#include <cassert>
#include <stdexcept>
#include <string>
#include <unordered_map>

// A facility for translating strings into enum values. Enums must specialize initNameToEnumMap.
template <typename T>
class EnumParser {
 public:
  // Constructs and initializes an enum parser. The kind names the enum in error messages.
  explicit EnumParser(const std::string& kind = "enum value") : kind(kind) {
    initNameToEnumMap();
  }

  // Fills the map with name/value pairs. Enumerations must specialize this member function.
  void initNameToEnumMap() {
    assert(false);
  }

  // Returns the enum value with the specified name.
  T operator()(const std::string& name) const {
    const auto iter = nameToEnum.find(name);
    if (iter == nameToEnum.end())
      throw std::invalid_argument("invalid " + kind + " -- '" + name + "'");
    return iter->second;
  }

  // Returns the name of the specified enum value.
  const std::string& nameOf(const T val) const {
    for (const auto& entry : nameToEnum)
      if (entry.second == val)
        return entry.first;
    throw std::invalid_argument("unnamed " + kind);
  }

 private:
  std::unordered_map<std::string, T> nameToEnum; // A map to translate strings into enum values.
  std::string kind;                              // The kind of value named in error messages.
};
