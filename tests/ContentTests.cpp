#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>

#include "../engine/rules/BudgetAllocator.h"
#include "../game/content/ContentBundle.h"

namespace {

void writeFile(const std::filesystem::path& path, const std::string& text) {
    std::ofstream out(path);
    out << text;
}

}  // namespace

int main() {
    using namespace Forge::Content;
    using Forge::Rules::Characteristic;
    namespace fs = std::filesystem;
    {
        // Built-in catalogs.
        const ContentBundle content = defaultContentBundle();
        assert(content.archetypes.all().size() == 14);
        assert(content.archetypes.defaultId() == "aggressive-fighter");
        assert(content.species.all().size() == 5);
        assert(content.skillLinks.links.size() == 44);
        assert(content.talents.size() == 58);

        auto lookup = content.archetypes.resolve("sneaky-assassin");
        assert(!lookup.fallback);
        assert(lookup.archetype->suggestedCareer == "Assassin");
        lookup = content.archetypes.resolve("pirate-king");
        assert(lookup.fallback);
        assert(lookup.archetype->id == "aggressive-fighter");

        assert(content.species.get("halfling").intrinsicTalents.size() == 3);
        assert(content.species.get("halfling").wounds == Forge::Rules::WoundsFormula::ToughnessWillpower);
        assert(content.species.get("goblin").id == "human");

        assert(content.skillLinks.linkedTo("Pick Lock") == Characteristic::Dex);
        assert(content.skillLinks.linkedTo("Underwater Basket Weaving") == Characteristic::WS);

        assert(content.talents.describe("Fearless") == "Immune to mundane fear");
        assert(content.talents.describe("Unheard Of") == "Special ability");

        assert(content.equipment.suggest("powerful-wizard").size() == 5);
        assert(content.equipment.suggest("powerful-wizard").front() == "Wizard's Staff");
        assert(content.equipment.suggest("unknown") == content.equipment.suggest("aggressive-fighter"));
    }
    {
        // Every archetype lists only real characteristics and a full kit.
        const ContentBundle content{};
        for (const auto& a : content.archetypes.all()) {
            assert(a.primary.size() == 3);
            assert(a.secondary.size() == 3);
            assert(a.favoredSkills.size() == 5);
            assert(a.favoredTalents.size() == 5);
            assert(content.equipment.contains(a.id));
        }
    }
#ifdef NPCFORGE_DATA_DIR
    {
        // The shipped data files reproduce the built-in content.
        const ContentBundle builtin{};
        const ContentBundle loaded = loadContentBundle(NPCFORGE_DATA_DIR);
        assert(loaded.archetypes.all().size() == builtin.archetypes.all().size());
        assert(loaded.species.all().size() == builtin.species.all().size());
        assert(loaded.skillLinks.links == builtin.skillLinks.links);
        assert(loaded.talents.size() == builtin.talents.size());
        assert(loaded.rules.characteristicCosts.costs == builtin.rules.characteristicCosts.costs);
        assert(loaded.rules.skillCosts.costs == builtin.rules.skillCosts.costs);
        for (const auto& a : builtin.archetypes.all()) {
            for (const auto& s : builtin.species.all()) {
                const Forge::Rules::AllocationInput in1{2500, a, s, builtin.skillLinks};
                const Forge::Rules::AllocationInput in2{2500, loaded.archetypes.get(a.id), loaded.species.get(s.id),
                                                        loaded.skillLinks};
                assert(Forge::Rules::allocateBudget(in1, builtin.rules) ==
                       Forge::Rules::allocateBudget(in2, loaded.rules));
            }
        }
    }
#endif
    const fs::path dir = fs::temp_directory_path() / "npcforge_content_test";
    fs::create_directories(dir);
    {
        // Overrides and additions on top of the defaults.
        writeFile(dir / "archetypes.json", R"({
            "default": "grim-watchman",
            "archetypes": [
                {"id": "grim-watchman", "name": "Grim Watchman", "description": "Night watch veteran",
                 "primary": ["wp", "t", "i"], "secondary": ["ws", "fel", "s"], "tertiary": ["bs", "ag", "dex", "int"],
                 "skills": ["Perception", "Intimidate"], "talents": ["Resolute"], "suggestedCareer": "Watchman"},
                {"id": "broken", "primary": ["ws", "luck"]}
            ]
        })");
        ArchetypeCatalog catalog{};
        assert(loadArchetypes((dir / "archetypes.json").string(), catalog));
        assert(catalog.all().size() == 15);
        assert(catalog.contains("grim-watchman"));
        assert(!catalog.contains("broken"));
        assert(catalog.defaultId() == "grim-watchman");
        assert(catalog.resolve("nope").archetype->id == "grim-watchman");
        assert(catalog.get("grim-watchman").primary.front() == Characteristic::WP);

        writeFile(dir / "species.json", R"({"species": [
            {"id": "ogre", "name": "Ogre", "characteristics": {"s": 45, "T": 45}, "movement": 6},
            {"id": "halfling", "fate": 4}
        ]})");
        SpeciesCatalog species{};
        assert(loadSpecies((dir / "species.json").string(), species));
        const auto& ogre = species.get("ogre");
        assert(ogre.id == "ogre");
        assert(ogre.baseline[Forge::Rules::indexOf(Characteristic::S)] == 45);
        assert(ogre.baseline[Forge::Rules::indexOf(Characteristic::T)] == 45);
        assert(ogre.baseline[Forge::Rules::indexOf(Characteristic::WS)] == 30);
        assert(ogre.movement == 6);
        const auto& halfling = species.get("halfling");
        assert(halfling.fate == 4);
        assert(halfling.fortune == 3);
        assert(halfling.baseline[Forge::Rules::indexOf(Characteristic::S)] == 15);
        assert(halfling.wounds == Forge::Rules::WoundsFormula::ToughnessWillpower);

        writeFile(dir / "rules.json", R"({"talentCost": 50, "advanceCap": 2, "skillCosts": [5, 10]})");
        Forge::Rules::AllocationRules rules{};
        assert(loadAllocationRules((dir / "rules.json").string(), rules));
        assert(rules.talentCost == 50);
        assert(rules.advanceCap == 2);
        assert(rules.skillCosts.costs.size() == 2);
        assert(rules.characteristicCosts.costs.front() == 25);

        writeFile(dir / "skills.json", R"({"fallback": "ag", "skills": {"Sail": "ag", "Gamble": "int", "Bad": "xx"}})");
        Forge::Rules::SkillLinks links = defaultSkillLinks();
        assert(loadSkillLinks((dir / "skills.json").string(), links));
        assert(links.fallback == Characteristic::Ag);
        assert(links.linkedTo("Gamble") == Characteristic::Int);
        assert(!links.contains("Bad"));
        assert(links.linkedTo("Bad") == Characteristic::Ag);
        assert(links.linkedTo("Pick Lock") == Characteristic::Dex);

        writeFile(dir / "talents.json", R"({"talents": {"Resolute": "Shrug off fear", "Grudge": "Never forgets"}})");
        TalentCatalog talents{};
        assert(loadTalents((dir / "talents.json").string(), talents));
        assert(talents.describe("Resolute") == "Shrug off fear");
        assert(talents.describe("Grudge") == "Never forgets");
        assert(talents.size() == 59);

        writeFile(dir / "equipment.json", R"({"equipment": {"grim-watchman": ["Lantern", "Halberd"]}})");
        EquipmentAdvisor equipment{};
        assert(loadEquipment((dir / "equipment.json").string(), equipment));
        assert(equipment.suggest("grim-watchman").size() == 2);
    }
    {
        // Malformed or invalid files leave the defaults untouched.
        writeFile(dir / "bad.json", "{ \"archetypes\": [ {\"id\": ");
        ArchetypeCatalog catalog{};
        assert(!loadArchetypes((dir / "bad.json").string(), catalog));
        assert(catalog.all().size() == 14);

        writeFile(dir / "bad_rules.json", R"({"talentCost": 50, "characteristicCosts": [25, -1]})");
        Forge::Rules::AllocationRules rules{};
        assert(!loadAllocationRules((dir / "bad_rules.json").string(), rules));
        assert(rules.talentCost == 100);

        writeFile(dir / "bad_fractions.json", R"({"categoryFractions": {"characteristics": 0.8, "skills": 0.5}})");
        assert(!loadAllocationRules((dir / "bad_fractions.json").string(), rules));
        assert(rules.characteristicFraction == 0.60);

        writeFile(dir / "array.json", "[1, 2, 3]");
        TalentCatalog talents{};
        assert(!loadTalents((dir / "array.json").string(), talents));

        SpeciesCatalog species{};
        assert(!loadSpecies((dir / "missing.json").string(), species));
        assert(species.all().size() == 5);
    }
    {
        // A directory with only some files keeps defaults for the rest.
        const fs::path partial = dir / "partial";
        fs::create_directories(partial);
        writeFile(partial / "rules.json", R"({"advanceCap": 10})");
        const ContentBundle bundle = loadContentBundle(partial.string());
        assert(bundle.rules.advanceCap == 10);
        assert(bundle.archetypes.all().size() == 14);

        const ContentBundle missing = loadContentBundle((dir / "does-not-exist").string());
        assert(missing.rules.advanceCap == 50);
        assert(missing.species.all().size() == 5);
    }
    {
        // Paths that cannot be stat'ed are reported, not thrown.
        const std::string unreachable = (dir / std::string(400, 'x') / "npc").string();
        Forge::Rules::AllocationRules rules{};
        assert(!loadAllocationRules(unreachable + "/rules.json", rules));
        assert(rules.talentCost == 100);
        const ContentBundle bundle = loadContentBundle(unreachable);
        assert(bundle.archetypes.all().size() == 14);
        assert(bundle.rules.advanceCap == 50);
    }
    fs::remove_all(dir);
    return 0;
}
