// Markdown rendering for the NPC tools.
#pragma once

#include <optional>
#include <string>

#include "../content/ContentBundle.h"
#include "NpcGenerator.h"

namespace Forge::Tools {

// Full NPC sheet. `actorId` is set when the payload was accepted by a game-session store.
std::string renderNpcReport(const GeneratedNpc& npc, const Content::TalentCatalog& talents,
                            const std::optional<std::string>& actorId = std::nullopt);

// Every archetype with its priorities, key skills and typical talents, then XP guidelines.
std::string renderArchetypeList(const Content::ArchetypeCatalog& archetypes, const Rules::AllocationRules& rules);

// Compact allocation breakdown for calculate-npc-xp-distribution.
std::string renderDistributionPreview(const GeneratedNpc& npc);

// Percentage of the budget actually spent, rounded half up; 0 for an empty budget.
int spendEfficiencyPercent(const Rules::AllocationSummary& summary, int totalBudget);

// "brave" -> "Brave".
std::string capitalize(const std::string& text);

}  // namespace Forge::Tools
