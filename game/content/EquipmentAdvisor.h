// Suggested starting gear per archetype.
#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "ArchetypeCatalog.h"

namespace Forge::Content {

class EquipmentAdvisor {
public:
    EquipmentAdvisor();
    explicit EquipmentAdvisor(std::unordered_map<std::string, std::vector<std::string>> kits,
                              std::string fallbackId = kDefaultArchetypeId);

    // Unknown archetypes get the fallback kit; empty if even that is missing.
    const std::vector<std::string>& suggest(const std::string& archetypeId) const;
    bool contains(const std::string& archetypeId) const;

    void set(const std::string& archetypeId, std::vector<std::string> items);

private:
    std::unordered_map<std::string, std::vector<std::string>> kits_;
    std::string fallbackId_;
};

std::unordered_map<std::string, std::vector<std::string>> defaultEquipmentKits();

}  // namespace Forge::Content
