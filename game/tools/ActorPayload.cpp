#include "ActorPayload.h"

namespace Forge::Tools {

using nlohmann::json;
using Rules::Characteristic;

namespace {

json pool(int value) { return json{{"value", value}, {"max", value}}; }

}  // namespace

json buildActorData(const GeneratedNpc& npc) {
    const auto& req = npc.request;
    const auto& summary = npc.allocation.summary;
    const std::string biography =
        req.description ? *req.description
                        : npc.archetype.name + " archetype NPC generated with " + std::to_string(req.totalXP) + " XP.";

    json characteristics = json::object();
    for (Characteristic c : Rules::allCharacteristics()) {
        const auto& data = npc.allocation.at(c);
        characteristics[std::string(Rules::characteristicKey(c))] = {
            {"initial", data.base},
            {"advances", data.advances},
            {"modifier", 0},
        };
    }

    json details = {
        {"species", {{"value", npc.species.id}}},
        {"biography", {{"value", biography}}},
        {"experience", {{"current", summary.remaining}, {"total", req.totalXP}, {"spent", summary.totalSpent}}},
    };
    json status = {
        {"wounds", pool(npc.derived.wounds)},
        {"fortune", pool(npc.derived.fortune)},
        {"fate", pool(npc.derived.fate)},
    };

    return json{
        {"name", req.name},
        {"type", "character"},
        {"system", {{"details", details}, {"characteristics", characteristics}, {"status", status}}},
    };
}

json buildSkillItem(const Rules::SkillAllocation& skill) {
    json system = {
        {"advanced", {{"value", "bsc"}}},
        {"grouped", {{"value", "noSpec"}}},
        {"characteristic", {{"value", std::string(Rules::characteristicKey(skill.linkedCharacteristic))}}},
        {"advances", {{"value", skill.advances}, {"costModifier", 0}, {"force", false}}},
        {"modifier", {{"value", 0}}},
        {"total", {{"value", skill.total}}},
    };
    return json{{"name", skill.name}, {"type", "skill"}, {"system", system}};
}

json buildTalentItem(const Rules::TalentAllocation& talent, const std::string& description) {
    json system = {
        {"max", {{"value", "none"}}},
        {"advances", {{"value", talent.rank}, {"force", false}}},
        {"tests", {{"value", description}}},
    };
    return json{{"name", talent.name}, {"type", "talent"}, {"system", system}};
}

json buildCreatePayload(const GeneratedNpc& npc, const Content::TalentCatalog& talents) {
    json items = json::array();
    for (const auto& skill : npc.allocation.skills) items.push_back(buildSkillItem(skill));
    for (const auto& talent : npc.allocation.talents) {
        items.push_back(buildTalentItem(talent, talents.describe(talent.name)));
    }
    return json{{"actor", buildActorData(npc)}, {"items", items}};
}

json allocationToJson(const Rules::AllocationResult& result) {
    json characteristics = json::object();
    for (Characteristic c : Rules::allCharacteristics()) {
        const auto& data = result.at(c);
        characteristics[std::string(Rules::characteristicKey(c))] = {
            {"base", data.base},
            {"advances", data.advances},
            {"final", data.final},
            {"xpSpent", data.xpSpent},
        };
    }

    json skills = json::array();
    for (const auto& s : result.skills) {
        skills.push_back({
            {"name", s.name},
            {"advances", s.advances},
            {"total", s.total},
            {"xpSpent", s.xpSpent},
            {"linkedCharacteristic", std::string(Rules::characteristicKey(s.linkedCharacteristic))},
        });
    }

    json talents = json::array();
    for (const auto& t : result.talents) {
        talents.push_back({{"name", t.name}, {"rank", t.rank}, {"xpSpent", t.xpSpent}, {"intrinsic", t.intrinsic}});
    }

    const auto& s = result.summary;
    return json{
        {"totalBudget", result.totalBudget},
        {"characteristics", characteristics},
        {"skills", skills},
        {"talents", talents},
        {"summary",
         {
             {"characteristicsXP", s.characteristicsXP},
             {"skillsXP", s.skillsXP},
             {"talentsXP", s.talentsXP},
             {"totalSpent", s.totalSpent},
             {"remaining", s.remaining},
         }},
    };
}

}  // namespace Forge::Tools
