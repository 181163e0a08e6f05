#include "NpcGenerator.h"

#include <utility>

#include "../../engine/core/Logger.h"
#include "../../engine/rules/BudgetAllocator.h"

namespace Forge::Tools {

namespace {

GeneratedNpc buildNpc(const Content::ContentBundle& content, NpcRequest request) {
    GeneratedNpc npc{};
    const auto lookup = content.archetypes.resolve(request.archetypeId);
    npc.archetype = *lookup.archetype;
    npc.archetypeFallback = lookup.fallback;
    if (lookup.fallback) {
        logWarn("Unknown archetype '" + request.archetypeId + "', using '" + npc.archetype.id + "'");
    }

    npc.speciesFallback = !content.species.contains(request.speciesId);
    npc.species = content.species.get(request.speciesId);
    if (npc.speciesFallback) {
        logWarn("Unknown species '" + request.speciesId + "', using '" + npc.species.id + "'");
    }

    const Rules::AllocationInput input{request.totalXP, npc.archetype, npc.species, content.skillLinks};
    npc.allocation = Rules::allocateBudget(input, content.rules);
    npc.derived = Rules::computeDerivedStats(npc.allocation, npc.species);
    npc.equipment = content.equipment.suggest(npc.archetype.id);
    npc.request = std::move(request);

    logDebug("Allocated " + std::to_string(npc.allocation.summary.totalSpent) + "/" +
             std::to_string(npc.allocation.totalBudget) + " XP for " + npc.archetype.id);
    return npc;
}

}  // namespace

void validateRequest(const NpcRequest& request) {
    if (request.name.empty()) throw ToolError("NPC name must not be empty");
    if (request.totalXP < 0 || request.totalXP > kMaxNpcXp) {
        throw ToolError("totalXP must be between 0 and " + std::to_string(kMaxNpcXp) + ", got " +
                        std::to_string(request.totalXP));
    }
    if (request.archetypeId.empty()) throw ToolError("archetype must not be empty");
}

GeneratedNpc generateNpc(const Content::ContentBundle& content, const NpcRequest& request) {
    validateRequest(request);
    logInfo("Creating custom NPC '" + request.name + "' (" + std::to_string(request.totalXP) + " XP, " +
            request.archetypeId + ")");
    return buildNpc(content, request);
}

GeneratedNpc previewDistribution(const Content::ContentBundle& content, int totalXP, const std::string& archetypeId) {
    if (totalXP < 0) throw ToolError("totalXP must not be negative, got " + std::to_string(totalXP));
    logInfo("Calculating XP distribution preview (" + std::to_string(totalXP) + " XP, " + archetypeId + ")");
    NpcRequest request{};
    request.totalXP = totalXP;
    request.archetypeId = archetypeId;
    request.speciesId = Content::kDefaultSpeciesId;
    return buildNpc(content, std::move(request));
}

}  // namespace Forge::Tools
