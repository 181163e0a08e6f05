// Species registry: starting characteristics, movement, fortune/fate and innate talents.
#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "../../engine/rules/NpcModel.h"

namespace Forge::Content {

using Rules::SpeciesDef;

inline constexpr const char* kDefaultSpeciesId = "human";

class SpeciesCatalog {
public:
    SpeciesCatalog();
    explicit SpeciesCatalog(std::vector<SpeciesDef> defs, std::string defaultId = kDefaultSpeciesId);

    // Unknown ids resolve to the default species (human).
    const SpeciesDef& get(const std::string& id) const;
    bool contains(const std::string& id) const;
    const std::vector<SpeciesDef>& all() const { return defs_; }
    const std::string& defaultId() const { return defaultId_; }

    void upsert(SpeciesDef def);

private:
    std::vector<SpeciesDef> defs_;
    std::unordered_map<std::string, std::size_t> index_;
    std::string defaultId_;
};

// human, halfling, dwarf, high-elf, wood-elf (average starting values, no rolls).
std::vector<SpeciesDef> defaultSpecies();

// Record used when nothing better is known: every characteristic at 30, movement 4, fortune 2, fate 2.
SpeciesDef baselineHuman();

}  // namespace Forge::Content
