#include "NpcModel.h"

#include <algorithm>

namespace Forge::Rules {

PriorityTier priorityOf(const ArchetypeDef& archetype, Characteristic c) {
    auto has = [c](const std::vector<Characteristic>& tier) {
        return std::find(tier.begin(), tier.end(), c) != tier.end();
    };
    if (has(archetype.primary)) return PriorityTier::Primary;
    if (has(archetype.secondary)) return PriorityTier::Secondary;
    return PriorityTier::Tertiary;
}

Characteristic SkillLinks::linkedTo(const std::string& skillName) const {
    auto it = links.find(skillName);
    return it != links.end() ? it->second : fallback;
}

bool SkillLinks::contains(const std::string& skillName) const { return links.count(skillName) > 0; }

bool operator==(const CharacteristicAllocation& a, const CharacteristicAllocation& b) {
    return a.base == b.base && a.advances == b.advances && a.final == b.final && a.xpSpent == b.xpSpent;
}

bool operator==(const SkillAllocation& a, const SkillAllocation& b) {
    return a.name == b.name && a.advances == b.advances && a.total == b.total && a.xpSpent == b.xpSpent &&
           a.linkedCharacteristic == b.linkedCharacteristic;
}

bool operator==(const TalentAllocation& a, const TalentAllocation& b) {
    return a.name == b.name && a.rank == b.rank && a.xpSpent == b.xpSpent && a.intrinsic == b.intrinsic;
}

bool operator==(const AllocationSummary& a, const AllocationSummary& b) {
    return a.characteristicsXP == b.characteristicsXP && a.skillsXP == b.skillsXP && a.talentsXP == b.talentsXP &&
           a.totalSpent == b.totalSpent && a.remaining == b.remaining;
}

bool operator==(const AllocationResult& a, const AllocationResult& b) {
    return a.totalBudget == b.totalBudget && a.characteristics == b.characteristics && a.skills == b.skills &&
           a.talents == b.talents && a.summary == b.summary;
}

}  // namespace Forge::Rules
