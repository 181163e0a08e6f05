#include <cassert>
#include <string>

#include "../game/content/ContentBundle.h"
#include "../game/tools/ActorPayload.h"
#include "../game/tools/NpcGenerator.h"
#include "../game/tools/NpcReport.h"

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

template <typename Fn>
bool throwsToolError(Fn&& fn) {
    try {
        fn();
    } catch (const Forge::Tools::ToolError&) {
        return true;
    }
    return false;
}

Forge::Tools::NpcRequest fighterRequest() {
    Forge::Tools::NpcRequest request{};
    request.name = "Gunther";
    request.totalXP = 1000;
    request.archetypeId = "aggressive-fighter";
    return request;
}

}  // namespace

int main() {
    using namespace Forge::Tools;
    const Forge::Content::ContentBundle content{};
    {
        // Request validation at the tool boundary.
        auto request = fighterRequest();
        request.name.clear();
        assert(throwsToolError([&] { generateNpc(content, request); }));
        request = fighterRequest();
        request.totalXP = kMaxNpcXp + 1;
        assert(throwsToolError([&] { generateNpc(content, request); }));
        request.totalXP = -1;
        assert(throwsToolError([&] { generateNpc(content, request); }));
        request = fighterRequest();
        request.archetypeId.clear();
        assert(throwsToolError([&] { validateRequest(request); }));
        request = fighterRequest();
        request.totalXP = kMaxNpcXp;
        assert(!throwsToolError([&] { validateRequest(request); }));
        assert(throwsToolError([&] { previewDistribution(content, -5, "agile-rogue"); }));
    }
    {
        // Generated NPC bundles allocation, derived stats and gear.
        auto request = fighterRequest();
        request.speciesId = "halfling";
        auto npc = generateNpc(content, request);
        assert(!npc.archetypeFallback);
        assert(!npc.speciesFallback);
        assert(npc.species.id == "halfling");
        assert(npc.derived.movement == 3);
        assert(contains(renderNpcReport(npc, content.talents), "**Species:** Halfling\n"));
        assert(npc.equipment.size() == 5);
        assert(npc.allocation.talents.size() == 4);
        assert(npc.allocation.talents[0].intrinsic);
        assert(npc.allocation.talents[0].name == "Night Vision");

        request = fighterRequest();
        request.archetypeId = "dragon-tamer";
        request.speciesId = "ratling";
        npc = generateNpc(content, request);
        assert(npc.archetypeFallback);
        assert(npc.speciesFallback);
        assert(npc.archetype.id == "aggressive-fighter");
        assert(npc.species.id == "human");
        assert(npc.request.archetypeId == "dragon-tamer");

        request = fighterRequest();
        request.speciesId = "high-elf";
        npc = generateNpc(content, request);
        assert(contains(renderNpcReport(npc, content.talents), "**Species:** High-elf\n"));
    }
    {
        // Full report sections.
        auto request = fighterRequest();
        request.personalityTraits = {"gruff", "loyal"};
        request.description = "Veteran of the Reikland wars";
        auto npc = generateNpc(content, request);
        const std::string report = renderNpcReport(npc, content.talents);
        assert(contains(report, "**Custom NPC Preview: Gunther**"));
        assert(contains(report, "**Species:** Human\n"));
        assert(contains(report, "**Suggested Career:** Soldier"));
        assert(contains(report, "**Description:** Veteran of the Reikland wars"));
        assert(contains(report, "- **Weapon Skill**: 34 (base 30, +4 advances, 100 XP) ★"));
        assert(contains(report, "- **Agility**: 32 (base 30, +2 advances, 50 XP) ✦"));
        assert(contains(report, "- **Melee (Basic)**: 39% (+5 advances, 50 XP)"));
        assert(contains(report, "- **Strike Mighty Blow** - Add SL to melee damage"));
        assert(contains(report, "## Personality Traits\n- Gruff\n- Loyal"));
        assert(contains(report, "- Shield"));
        assert(contains(report, "- **Remaining:** 100 XP"));
        assert(contains(report, "- **Wounds:** 12"));
        assert(contains(report, "- **Resilience:** 6"));

        const std::string created = renderNpcReport(npc, content.talents, std::string("actor-42"));
        assert(contains(created, "**Custom NPC Created: Gunther**"));
        assert(contains(created, "**Actor ID**: actor-42"));

        request = fighterRequest();
        request.totalXP = 0;
        request.career = "Road Warden";
        npc = generateNpc(content, request);
        const std::string empty = renderNpcReport(npc, content.talents);
        assert(contains(empty, "**Career:** Road Warden"));
        assert(contains(empty, "*No skills acquired with this XP budget*"));
        assert(contains(empty, "*No talents acquired with this XP budget*"));
        assert(!contains(empty, "## Personality Traits"));
    }
    {
        // Archetype listing and XP guidelines.
        const std::string list = renderArchetypeList(content.archetypes, content.rules);
        for (const auto& a : content.archetypes.all()) assert(contains(list, "**ID:** `" + a.id + "`"));
        assert(contains(list, "**Primary Characteristics** (50% of XP): WS, S, T"));
        assert(contains(list, "**Tertiary Characteristics** (20% of XP): BS, DEX, INT, FEL"));
        assert(contains(list, "**Typical Talents:** Strike Mighty Blow, Combat Reflexes, Fearless\n"));
        assert(contains(list, "4000+ XP"));
    }
    {
        // Distribution preview.
        auto npc = previewDistribution(content, 1000, "aggressive-fighter");
        assert(npc.species.id == "human");
        std::string preview = renderDistributionPreview(npc);
        assert(contains(preview, "**XP Distribution Preview: Aggressive Fighter**"));
        assert(contains(preview, "- **WS**: 30 → 34 (+4, 100 XP)"));
        assert(contains(preview, "- **Efficiency:** 90%"));

        npc = previewDistribution(content, 0, "aggressive-fighter");
        preview = renderDistributionPreview(npc);
        assert(contains(preview, "- **Efficiency:** 0%"));
        assert(contains(preview, "*No skills with this XP budget*"));
        assert(!contains(preview, "- **WS**"));
        assert(capitalize("brave") == "Brave");
        assert(capitalize("").empty());
    }
    {
        // Store payloads.
        auto npc = generateNpc(content, fighterRequest());
        auto actor = buildActorData(npc);
        assert(actor["name"] == "Gunther");
        assert(actor["type"] == "character");
        const auto& system = actor["system"];
        assert(system["details"]["species"]["value"] == "human");
        assert(system["details"]["biography"]["value"] ==
               "Aggressive Fighter archetype NPC generated with 1000 XP.");
        assert(system["details"]["experience"]["current"] == 100);
        assert(system["details"]["experience"]["total"] == 1000);
        assert(system["details"]["experience"]["spent"] == 900);
        assert(system["characteristics"].size() == 10);
        assert(system["characteristics"]["ws"]["initial"] == 30);
        assert(system["characteristics"]["ws"]["advances"] == 4);
        assert(system["characteristics"]["ws"]["modifier"] == 0);
        assert(system["status"]["wounds"]["max"] == 12);
        assert(system["status"]["fate"]["value"] == 2);

        auto skill = buildSkillItem(npc.allocation.skills[3]);
        assert(skill["type"] == "skill");
        assert(skill["system"]["characteristic"]["value"] == "fel");
        assert(skill["system"]["advanced"]["value"] == "bsc");
        assert(skill["system"]["advances"]["value"] == 5);
        assert(skill["system"]["total"]["value"] == 36);

        auto talent = buildTalentItem(npc.allocation.talents[0], content.talents.describe("Strike Mighty Blow"));
        assert(talent["type"] == "talent");
        assert(talent["system"]["advances"]["value"] == 1);
        assert(talent["system"]["tests"]["value"] == "Add SL to melee damage");

        auto payload = buildCreatePayload(npc, content.talents);
        assert(payload["items"].size() == 6);
        assert(payload["actor"] == actor);

        auto dump = allocationToJson(npc.allocation);
        assert(dump["totalBudget"] == 1000);
        assert(dump["summary"]["remaining"] == 100);
        assert(dump["characteristics"]["ws"]["final"] == 34);
        assert(dump["skills"].size() == 5);
        assert(dump["talents"][0]["intrinsic"] == false);
    }
    return 0;
}
