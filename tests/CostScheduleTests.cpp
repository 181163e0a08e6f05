#include <cassert>
#include <limits>

#include "../engine/rules/BudgetAllocator.h"
#include "../engine/rules/CostSchedule.h"

int main() {
    using namespace Forge::Rules;
    const AllocationRules rules{};
    {
        // Increments 0..5 share the first tier; later tiers span five increments.
        assert(tierForIncrement(0) == 0);
        assert(tierForIncrement(5) == 0);
        assert(tierForIncrement(6) == 1);
        assert(tierForIncrement(10) == 1);
        assert(tierForIncrement(11) == 2);
        assert(tierForIncrement(-3) == 0);
        assert(rules.costOf(ScheduleKind::Characteristic, 5) == 25);
        assert(rules.costOf(ScheduleKind::Characteristic, 6) == 30);
        assert(rules.costOf(ScheduleKind::Characteristic, 11) == 40);
        assert(rules.costOf(ScheduleKind::Skill, 5) == 10);
        assert(rules.costOf(ScheduleKind::Skill, 6) == 15);
    }
    {
        // Past the last tier the schedule clamps to its final cost.
        assert(rules.costOf(ScheduleKind::Characteristic, 46) == 240);
        assert(rules.costOf(ScheduleKind::Characteristic, 1000) == 240);
        assert(rules.costOf(ScheduleKind::Skill, 1000) == 180);
    }
    {
        // Empty schedules cost nothing and never buy an advance.
        const CostSchedule empty{};
        assert(costForNext(empty, 0) == 0);
        AllocationRules noSkills{};
        noSkills.skillCosts = CostSchedule{};
        auto bought = purchaseAdvances(500, ScheduleKind::Skill, noSkills);
        assert(bought.advances == 0);
        assert(bought.spent == 0);
    }
    {
        // Greedy purchase stops when the next advance no longer fits.
        auto bought = purchaseAdvances(100, ScheduleKind::Characteristic, rules);
        assert(bought.advances == 4);
        assert(bought.spent == 100);
        bought = purchaseAdvances(24, ScheduleKind::Characteristic, rules);
        assert(bought.advances == 0);
        bought = purchaseAdvances(250, ScheduleKind::Skill, rules);
        assert(bought.advances == 16);
        assert(bought.spent == 235);
    }
    {
        // The advance cap bounds a single purchase even with a huge budget.
        auto bought = purchaseAdvances(100000, ScheduleKind::Characteristic, rules);
        assert(bought.advances == 50);
        assert(bought.spent == 4810);
        AllocationRules capped{};
        capped.advanceCap = 3;
        bought = purchaseAdvances(1000, ScheduleKind::Skill, capped);
        assert(bought.advances == 3);
        assert(bought.spent == 30);
    }
    {
        // A cost near INT_MAX is simply unaffordable; spend never wraps past the budget.
        AllocationRules huge{};
        huge.characteristicCosts = CostSchedule{{1, std::numeric_limits<int>::max()}};
        auto bought = purchaseAdvances(100, ScheduleKind::Characteristic, huge);
        assert(bought.advances == 6);
        assert(bought.spent == 6);
        bought = purchaseAdvances(std::numeric_limits<int>::max(), ScheduleKind::Characteristic, huge);
        assert(bought.advances == 6);
        assert(bought.spent == 6);
    }
    return 0;
}
