#pragma once

#include "DataStructures/Lottery/NumberSet.h"
#include "Tools/EnumParser.h"

// The prize tiers of the lottery, determined by primary and secondary hits.
enum class PrizeTier {
  NONE,
  FIRST,  // 6 + 1
  SECOND, // 6 + 0
  THIRD,  // 5 + 1
  FOURTH, // 5 + 0 or 4 + 1
  FIFTH,  // 4 + 0 or 3 + 1
  SIXTH,  // 2 + 1, 1 + 1 or 0 + 1
};

// The number of prize tiers, including NONE.
constexpr int NUM_PRIZE_TIERS = 7;

// Make EnumParser usable with PrizeTier.
template <>
inline void EnumParser<PrizeTier>::initNameToEnumMap() {
  nameToEnum = {
    {"none",   PrizeTier::NONE},
    {"first",  PrizeTier::FIRST},
    {"second", PrizeTier::SECOND},
    {"third",  PrizeTier::THIRD},
    {"fourth", PrizeTier::FOURTH},
    {"fifth",  PrizeTier::FIFTH},
    {"sixth",  PrizeTier::SIXTH},
  };
}

// Returns the prize tier that the specified ticket wins in the specified draw.
inline PrizeTier judgePrize(const NumberSet& ticket, const NumberSet& draw) {
  const auto primaryHits = ticket.numCommonPrimary(draw);
  const auto secondaryHit = ticket.secondary == draw.secondary;
  if (primaryHits == 6)
    return secondaryHit ? PrizeTier::FIRST : PrizeTier::SECOND;
  if (primaryHits == 5)
    return secondaryHit ? PrizeTier::THIRD : PrizeTier::FOURTH;
  if (primaryHits == 4)
    return secondaryHit ? PrizeTier::FOURTH : PrizeTier::FIFTH;
  if (primaryHits == 3 && secondaryHit)
    return PrizeTier::FIFTH;
  return secondaryHit ? PrizeTier::SIXTH : PrizeTier::NONE;
}
