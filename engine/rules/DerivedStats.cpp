#include "DerivedStats.h"

#include <algorithm>

namespace Forge::Rules {

int computeWounds(int strength, int toughness, int willpower, WoundsFormula formula) {
    const int sb = characteristicBonus(strength);
    const int tb = characteristicBonus(toughness);
    const int wpb = characteristicBonus(willpower);
    int wounds = 2 * tb + wpb;
    if (formula == WoundsFormula::StrengthToughnessWillpower) wounds += sb;
    return std::max(wounds, 1);
}

NpcDerivedStats computeDerivedStats(int strength, int toughness, int willpower, const SpeciesDef& species) {
    NpcDerivedStats out{};
    out.wounds = computeWounds(strength, toughness, willpower, species.wounds);
    out.movement = species.movement;
    out.fortune = species.fortune;
    out.fate = species.fate;
    out.resilience = characteristicBonus(toughness) + characteristicBonus(willpower);
    return out;
}

NpcDerivedStats computeDerivedStats(const AllocationResult& allocation, const SpeciesDef& species) {
    return computeDerivedStats(allocation.at(Characteristic::S).final, allocation.at(Characteristic::T).final,
                               allocation.at(Characteristic::WP).final, species);
}

}  // namespace Forge::Rules
