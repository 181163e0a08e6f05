// All NPC generation content in one immutable-after-load value, plus its JSON loaders.
#pragma once

#include <string>

#include "../../engine/rules/CostSchedule.h"
#include "../../engine/rules/NpcModel.h"
#include "ArchetypeCatalog.h"
#include "EquipmentAdvisor.h"
#include "SkillTable.h"
#include "SpeciesCatalog.h"
#include "TalentCatalog.h"

namespace Forge::Content {

struct ContentBundle {
    Rules::AllocationRules rules{};
    ArchetypeCatalog archetypes{};
    SpeciesCatalog species{};
    Rules::SkillLinks skillLinks{defaultSkillLinks()};
    TalentCatalog talents{};
    EquipmentAdvisor equipment{};
};

// Built-in data only.
ContentBundle defaultContentBundle();

// Defaults overlaid with whatever JSON files exist in `dir`:
// rules.json, archetypes.json, species.json, skills.json, talents.json, equipment.json.
ContentBundle loadContentBundle(const std::string& dir);

// Each loader applies a single file on top of `out`. Returns false when the file is
// missing, unreadable or malformed; `out` keeps its previous values in that case.
// Malformed records inside an otherwise valid file are skipped with a warning.
bool loadAllocationRules(const std::string& path, Rules::AllocationRules& out);
bool loadArchetypes(const std::string& path, ArchetypeCatalog& out);
bool loadSpecies(const std::string& path, SpeciesCatalog& out);
bool loadSkillLinks(const std::string& path, Rules::SkillLinks& out);
bool loadTalents(const std::string& path, TalentCatalog& out);
bool loadEquipment(const std::string& path, EquipmentAdvisor& out);

}  // namespace Forge::Content
