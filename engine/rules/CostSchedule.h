// Progressive XP cost tables and the tunable constants of the allocation engine.
#pragma once

#include <vector>

namespace Forge::Rules {

enum class ScheduleKind { Characteristic, Skill };

// Ordered per-tier costs. Later tiers cost more; indexing past the end clamps to the last entry.
struct CostSchedule {
    std::vector<int> costs;
};

// Tier of the advance bought after `incrementIndex` advances already taken.
// Increments 0..5 share tier 0 and each later tier spans five increments (6..10, 11..15, ...).
int tierForIncrement(int incrementIndex);

// Cost of the next advance. An empty schedule costs 0.
int costForNext(const CostSchedule& schedule, int incrementIndex);

// Data-driven allocation constants (defaults follow WFRP 4e).
struct AllocationRules {
    CostSchedule characteristicCosts{{25, 30, 40, 50, 70, 90, 120, 150, 190, 240}};
    CostSchedule skillCosts{{10, 15, 20, 30, 40, 60, 80, 110, 140, 180}};
    int talentCost{100};  // flat, per rank

    // Category split; talents take the remainder.
    double characteristicFraction{0.60};
    double skillFraction{0.25};

    // Share of the characteristic budget per priority tier.
    double primaryShare{0.50};
    double secondaryShare{0.30};
    double tertiaryShare{0.20};

    // Upper bound on advances bought for one characteristic or skill in a single allocation.
    int advanceCap{50};

    const CostSchedule& schedule(ScheduleKind kind) const;
    int costOf(ScheduleKind kind, int incrementIndex) const;
};

}  // namespace Forge::Rules
