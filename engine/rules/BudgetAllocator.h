// XP budget allocation: spends an NPC's experience across characteristics, skills and talents.
#pragma once

#include "CostSchedule.h"
#include "NpcModel.h"

namespace Forge::Rules {

// Category sub-budgets derived from a total XP budget.
struct BudgetSplit {
    int characteristics{0};
    int skills{0};
    int talents{0};
};

// floor(60%) / floor(25%) / remainder. Zero or negative totals split into zeros.
BudgetSplit splitBudget(int totalBudget, const AllocationRules& rules = {});

// XP available to one characteristic given its archetype priority.
int characteristicSubBudget(int characteristicBudget, const ArchetypeDef& archetype, Characteristic c,
                            const AllocationRules& rules = {});

struct AdvancePurchase {
    int advances{0};
    int spent{0};
};

// Buys advances one at a time from `kind`'s schedule while the next one fits in `budget`.
// Stops at rules.advanceCap, and never buys a zero-cost advance.
AdvancePurchase purchaseAdvances(int budget, ScheduleKind kind, const AllocationRules& rules = {});

struct AllocationInput {
    int totalBudget{0};
    const ArchetypeDef& archetype;
    const SpeciesDef& species;
    const SkillLinks& skillLinks;
};

// Deterministic and total over every integer budget; the inputs are only read.
AllocationResult allocateBudget(const AllocationInput& input, const AllocationRules& rules = {});

}  // namespace Forge::Rules
