// JSON payloads for a game-session store (create-actor / create-item), plus a plain dump of an allocation.
#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "../../engine/rules/NpcModel.h"
#include "NpcGenerator.h"

namespace Forge::Tools {

nlohmann::json buildActorData(const GeneratedNpc& npc);
nlohmann::json buildSkillItem(const Rules::SkillAllocation& skill);
nlohmann::json buildTalentItem(const Rules::TalentAllocation& talent, const std::string& description);

// {"actor": ..., "items": [skills..., talents...]} for one generated NPC.
nlohmann::json buildCreatePayload(const GeneratedNpc& npc, const Content::TalentCatalog& talents);

nlohmann::json allocationToJson(const Rules::AllocationResult& result);

}  // namespace Forge::Tools
