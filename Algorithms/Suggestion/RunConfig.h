#pragma once

#include <stdexcept>
#include <string>

#include "Algorithms/Posterior/PosteriorEstimator.h"
#include "Algorithms/Suggestion/PresetConfig.h"
#include "Tools/Constants.h"
#include "Tools/EnumParser.h"

// The modes of a suggestion run.
enum class SuggestionMode {
  TOP,    // Emit only the deterministic top candidate.
  SAMPLE, // Additionally emit sampled candidates and, optionally, a selected winner.
};

// Make EnumParser usable with SuggestionMode.
template <>
inline void EnumParser<SuggestionMode>::initNameToEnumMap() {
  nameToEnum = {
    {"top",    SuggestionMode::TOP},
    {"sample", SuggestionMode::SAMPLE},
  };
}

// The configuration of one suggestion run. It is passed explicitly into the pipeline, so runs with
// different configurations never interfere with each other.
struct RunConfig {
  // Overrides beta, temperature, recent and decay with the values of the specified preset.
  void applyPreset(const Preset preset) {
    const auto values = PresetConfig::of(preset);
    beta = values.beta;
    temperature = values.temperature;
    estimator.recent = values.recent;
    estimator.decay = values.decay;
  }

  // Throws std::invalid_argument if some parameter is out of range.
  void validate() const {
    if (mode == SuggestionMode::SAMPLE && numSamples < 1)
      throw std::invalid_argument("number of samples is smaller than 1");
    if (numSamples > MAX_NUM_SAMPLES)
      throw std::invalid_argument("number of samples is larger than " +
                                  std::to_string(MAX_NUM_SAMPLES));
    if (seed < 0)
      throw std::invalid_argument("seed is smaller than 0");
    if (temperature <= 0)
      throw std::invalid_argument("temperature is no larger than 0");
    if (beta < 0)
      throw std::invalid_argument("beta is smaller than 0");
    estimator.validate();
  }

  SuggestionMode mode = SuggestionMode::SAMPLE; // The mode of the run.
  int numSamples = DEFAULT_NUM_SAMPLES;         // The number of sampled candidates.
  long long seed = DEFAULT_SEED;                // The seed of the sampling engine.
  bool runSelector = true;                      // Select a winner among top and samples?
  EstimatorParams estimator;                    // The parameters of the posterior estimation.
  double temperature = DEFAULT_TEMPERATURE;     // The sampling temperature.
  double beta = DEFAULT_BETA;                   // The weight of the overlap penalty.
};
