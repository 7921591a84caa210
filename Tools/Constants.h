#pragma once

// A special value representing an invalid index.
constexpr int INVALID_INDEX = -1;

// The number of values in the primary pool. Primary numbers range from 1 to NUM_PRIMARY_NUMBERS.
constexpr int NUM_PRIMARY_NUMBERS = 33;

// The number of distinct primary numbers drawn per play.
constexpr int NUM_PRIMARY_PICKS = 6;

// The number of values in the secondary pool. Secondary numbers range from 1 to
// NUM_SECONDARY_NUMBERS.
constexpr int NUM_SECONDARY_NUMBERS = 16;

// The default parameters of a suggestion run.
constexpr int DEFAULT_NUM_SAMPLES = 6;
constexpr int MAX_NUM_SAMPLES = 5000; // Bounds the pairwise overlap table of the selector.
constexpr int DEFAULT_SEED = 42;
constexpr double DEFAULT_ALPHA = 1.0;
constexpr double DEFAULT_BETA = 0.5;
constexpr double DEFAULT_TEMPERATURE = 1.0;

// The number of simulated draws that share a random number generator in the strategy simulator.
#ifndef SIM_DRAWS_PER_BLOCK
# define SIM_DRAWS_PER_BLOCK 4096
#endif
