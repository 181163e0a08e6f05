#include "CostSchedule.h"

#include <algorithm>

namespace Forge::Rules {

int tierForIncrement(int incrementIndex) {
    const int idx = std::max(0, incrementIndex);
    return idx <= 5 ? 0 : (idx - 1) / 5;
}

int costForNext(const CostSchedule& schedule, int incrementIndex) {
    if (schedule.costs.empty()) return 0;
    const auto last = static_cast<int>(schedule.costs.size()) - 1;
    const int tier = std::min(tierForIncrement(incrementIndex), last);
    return schedule.costs[static_cast<std::size_t>(tier)];
}

const CostSchedule& AllocationRules::schedule(ScheduleKind kind) const {
    return kind == ScheduleKind::Skill ? skillCosts : characteristicCosts;
}

int AllocationRules::costOf(ScheduleKind kind, int incrementIndex) const {
    return costForNext(schedule(kind), incrementIndex);
}

}  // namespace Forge::Rules
