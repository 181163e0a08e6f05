// Secondary statistics computed from an allocated characteristic set.
#pragma once

#include "NpcModel.h"

namespace Forge::Rules {

struct NpcDerivedStats {
    int wounds{1};
    int movement{4};
    int fortune{2};
    int fate{2};
    int resilience{0};  // TB + WPB
};

// Wounds from final S, T and WP values; never below 1.
int computeWounds(int strength, int toughness, int willpower, WoundsFormula formula);

NpcDerivedStats computeDerivedStats(int strength, int toughness, int willpower, const SpeciesDef& species);
NpcDerivedStats computeDerivedStats(const AllocationResult& allocation, const SpeciesDef& species);

}  // namespace Forge::Rules
