// NPC generation operations: validate a request, run the allocator, gather derived stats and gear.
#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "../../engine/rules/DerivedStats.h"
#include "../../engine/rules/NpcModel.h"
#include "../content/ContentBundle.h"

namespace Forge::Tools {

// Invalid tool arguments (empty name, out-of-range XP, ...).
class ToolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

inline constexpr int kMaxNpcXp = 10000;

struct NpcRequest {
    std::string name;
    int totalXP{0};
    std::string archetypeId;
    std::string speciesId{"human"};
    std::vector<std::string> personalityTraits;
    std::optional<std::string> career;
    std::optional<std::string> description;
};

struct GeneratedNpc {
    NpcRequest request;
    Rules::ArchetypeDef archetype;
    Rules::SpeciesDef species;
    bool archetypeFallback{false};
    bool speciesFallback{false};
    Rules::AllocationResult allocation;
    Rules::NpcDerivedStats derived;
    std::vector<std::string> equipment;
};

// Throws ToolError when the request is out of bounds.
void validateRequest(const NpcRequest& request);

// create-custom-npc: validates, then builds the full NPC sheet.
GeneratedNpc generateNpc(const Content::ContentBundle& content, const NpcRequest& request);

// calculate-npc-xp-distribution: human species, no name required. Throws ToolError for negative XP.
GeneratedNpc previewDistribution(const Content::ContentBundle& content, int totalXP, const std::string& archetypeId);

}  // namespace Forge::Tools
