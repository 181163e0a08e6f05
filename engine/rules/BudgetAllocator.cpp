// Implementation of the greedy XP allocation pipeline.
#include "BudgetAllocator.h"

#include <algorithm>
#include <cmath>

namespace Forge::Rules {

namespace {

int floorToInt(double value) {
    return static_cast<int>(std::floor(value));
}

std::size_t tierSize(const ArchetypeDef& archetype, PriorityTier tier) {
    switch (tier) {
        case PriorityTier::Primary:
            return archetype.primary.size();
        case PriorityTier::Secondary:
            return archetype.secondary.size();
        case PriorityTier::Tertiary:
        default: {
            // Unlisted characteristics are tertiary too, so count them alongside the explicit list.
            std::size_t count = 0;
            for (Characteristic c : allCharacteristics()) {
                if (priorityOf(archetype, c) == PriorityTier::Tertiary) ++count;
            }
            return count;
        }
    }
}

double tierShare(PriorityTier tier, const AllocationRules& rules) {
    switch (tier) {
        case PriorityTier::Primary:
            return rules.primaryShare;
        case PriorityTier::Secondary:
            return rules.secondaryShare;
        case PriorityTier::Tertiary:
        default:
            return rules.tertiaryShare;
    }
}

void allocateCharacteristics(const AllocationInput& in, int budget, const AllocationRules& rules,
                             AllocationResult& out) {
    for (Characteristic c : allCharacteristics()) {
        const int subBudget = characteristicSubBudget(budget, in.archetype, c, rules);
        const AdvancePurchase bought = purchaseAdvances(subBudget, ScheduleKind::Characteristic, rules);

        CharacteristicAllocation& entry = out.characteristics[indexOf(c)];
        entry.base = in.species.baseline[indexOf(c)];
        entry.advances = bought.advances;
        entry.final = entry.base + bought.advances;
        entry.xpSpent = bought.spent;
        out.summary.characteristicsXP += bought.spent;
    }
}

void allocateSkills(const AllocationInput& in, int budget, const AllocationRules& rules, AllocationResult& out) {
    const auto& skills = in.archetype.favoredSkills;
    if (skills.empty()) return;
    const int perSkill = budget / static_cast<int>(skills.size());

    for (const auto& name : skills) {
        const AdvancePurchase bought = purchaseAdvances(perSkill, ScheduleKind::Skill, rules);
        if (bought.advances == 0) continue;  // unaffordable skills are left out of the sheet

        SkillAllocation skill{};
        skill.name = name;
        skill.advances = bought.advances;
        skill.xpSpent = bought.spent;
        skill.linkedCharacteristic = in.skillLinks.linkedTo(name);
        skill.total = out.at(skill.linkedCharacteristic).final + bought.advances;
        out.skills.push_back(std::move(skill));
        out.summary.skillsXP += bought.spent;
    }
}

void allocateTalents(const AllocationInput& in, int budget, const AllocationRules& rules, AllocationResult& out) {
    for (const auto& name : in.species.intrinsicTalents) {
        out.talents.push_back(TalentAllocation{name, 1, 0, true});
    }

    if (rules.talentCost <= 0) return;
    const std::size_t affordable = static_cast<std::size_t>(std::max(0, budget / rules.talentCost));
    const std::size_t count = std::min(affordable, in.archetype.favoredTalents.size());
    for (std::size_t i = 0; i < count; ++i) {
        out.talents.push_back(TalentAllocation{in.archetype.favoredTalents[i], 1, rules.talentCost, false});
        out.summary.talentsXP += rules.talentCost;
    }
}

}  // namespace

BudgetSplit splitBudget(int totalBudget, const AllocationRules& rules) {
    BudgetSplit split{};
    if (totalBudget <= 0) return split;
    const double total = static_cast<double>(totalBudget);
    split.characteristics = std::max(0, floorToInt(total * rules.characteristicFraction));
    split.skills = std::max(0, floorToInt(total * rules.skillFraction));
    split.talents = std::max(0, totalBudget - split.characteristics - split.skills);
    return split;
}

int characteristicSubBudget(int characteristicBudget, const ArchetypeDef& archetype, Characteristic c,
                            const AllocationRules& rules) {
    if (characteristicBudget <= 0) return 0;
    const PriorityTier tier = priorityOf(archetype, c);
    const std::size_t members = tierSize(archetype, tier);
    if (members == 0) return 0;
    const double share = static_cast<double>(characteristicBudget) * tierShare(tier, rules);
    return std::max(0, floorToInt(share / static_cast<double>(members)));
}

AdvancePurchase purchaseAdvances(int budget, ScheduleKind kind, const AllocationRules& rules) {
    AdvancePurchase out{};
    while (out.spent < budget && out.advances < rules.advanceCap) {
        const int cost = rules.costOf(kind, out.advances);
        if (cost <= 0 || cost > budget - out.spent) break;
        out.spent += cost;
        ++out.advances;
    }
    return out;
}

AllocationResult allocateBudget(const AllocationInput& input, const AllocationRules& rules) {
    AllocationResult result{};
    result.totalBudget = input.totalBudget;

    const BudgetSplit split = splitBudget(input.totalBudget, rules);
    allocateCharacteristics(input, split.characteristics, rules, result);
    // Skill totals read the final characteristic values, so characteristics go first.
    allocateSkills(input, split.skills, rules, result);
    allocateTalents(input, split.talents, rules, result);

    AllocationSummary& s = result.summary;
    s.totalSpent = s.characteristicsXP + s.skillsXP + s.talentsXP;
    s.remaining = input.totalBudget - s.totalSpent;
    return result;
}

}  // namespace Forge::Rules
