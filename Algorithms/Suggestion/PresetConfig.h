#pragma once

#include "Tools/Constants.h"
#include "Tools/EnumParser.h"

// Named parameter bundles that shift the trade-off between likelihood and diversity.
enum class Preset {
  DEFAULT,
  BALANCED,
  DEDUP,
  HOT,
};

// Make EnumParser usable with Preset.
template <>
inline void EnumParser<Preset>::initNameToEnumMap() {
  nameToEnum = {
    {"default",  Preset::DEFAULT},
    {"balanced", Preset::BALANCED},
    {"dedup",    Preset::DEDUP},
    {"hot",      Preset::HOT},
  };
}

// The parameter values of a preset. A recent value of 0 means that all draws are used.
struct PresetConfig {
  double beta;        // The weight of the overlap penalty.
  double temperature; // The sampling temperature.
  int recent;         // The number of most recent draws the posterior is estimated from.
  double decay;       // The per-draw time decay of the posterior estimation.

  // Returns the parameter values of the specified preset.
  static PresetConfig of(const Preset preset) {
    switch (preset) {
      case Preset::BALANCED:
        return {0.6, 1.2, 120, 0.98};
      case Preset::DEDUP:
        return {0.9, 1.5, 90, 0.97};
      case Preset::HOT:
        return {0.3, 0.8, 300, 1.0};
      default:
        return {DEFAULT_BETA, DEFAULT_TEMPERATURE, 0, 1.0};
    }
  }
};
