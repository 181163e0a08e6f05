#include "SpeciesCatalog.h"

#include <utility>

namespace Forge::Content {

using Rules::WoundsFormula;

SpeciesDef baselineHuman() {
    SpeciesDef human{};
    human.id = "human";
    human.name = "Human";
    human.baseline.fill(30);
    human.movement = 4;
    human.fortune = 2;
    human.fate = 2;
    return human;
}

std::vector<SpeciesDef> defaultSpecies() {
    // Baselines in ws, bs, s, t, i, ag, dex, int, wp, fel order.
    return {
        baselineHuman(),
        {"halfling", "Halfling", {{20, 35, 15, 25, 35, 35, 35, 35, 40, 35}}, 3, 3, 3,
         {"Night Vision", "Resistance (Chaos)", "Small"}, WoundsFormula::ToughnessWillpower},
        {"dwarf", "Dwarf", {{35, 25, 30, 40, 25, 20, 35, 30, 45, 25}}, 3, 2, 2,
         {"Magic Resistance", "Night Vision", "Resolute", "Sturdy"}, WoundsFormula::StrengthToughnessWillpower},
        {"high-elf", "High Elf", {{35, 35, 25, 25, 40, 35, 35, 35, 35, 30}}, 5, 2, 1,
         {"Acute Sense (Sight)", "Coolheaded", "Night Vision", "Second Sight", "Read/Write"},
         WoundsFormula::StrengthToughnessWillpower},
        {"wood-elf", "Wood Elf", {{35, 35, 25, 25, 40, 35, 35, 30, 35, 30}}, 5, 2, 1,
         {"Acute Sense (Sight)", "Hardy", "Night Vision", "Read/Write", "Rover"},
         WoundsFormula::StrengthToughnessWillpower},
    };
}

SpeciesCatalog::SpeciesCatalog() : SpeciesCatalog(defaultSpecies()) {}

SpeciesCatalog::SpeciesCatalog(std::vector<SpeciesDef> defs, std::string defaultId)
    : defaultId_(std::move(defaultId)) {
    for (auto& def : defs) upsert(std::move(def));
}

const SpeciesDef& SpeciesCatalog::get(const std::string& id) const {
    auto it = index_.find(id);
    if (it != index_.end()) return defs_[it->second];
    it = index_.find(defaultId_);
    if (it != index_.end()) return defs_[it->second];
    static const SpeciesDef kHuman = baselineHuman();
    return kHuman;
}

bool SpeciesCatalog::contains(const std::string& id) const { return index_.count(id) > 0; }

void SpeciesCatalog::upsert(SpeciesDef def) {
    auto it = index_.find(def.id);
    if (it != index_.end()) {
        defs_[it->second] = std::move(def);
        return;
    }
    index_[def.id] = defs_.size();
    defs_.push_back(std::move(def));
}

}  // namespace Forge::Content
