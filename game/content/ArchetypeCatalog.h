// Archetype registry: characteristic priorities, favored skills and talents per NPC archetype.
#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "../../engine/rules/NpcModel.h"

namespace Forge::Content {

using Rules::ArchetypeDef;

inline constexpr const char* kDefaultArchetypeId = "aggressive-fighter";

struct ArchetypeLookup {
    const ArchetypeDef* archetype{nullptr};
    bool fallback{false};  // true when the requested id was unknown
};

class ArchetypeCatalog {
public:
    ArchetypeCatalog();
    explicit ArchetypeCatalog(std::vector<ArchetypeDef> defs, std::string defaultId = kDefaultArchetypeId);

    // Unknown ids resolve to the default archetype.
    const ArchetypeDef& get(const std::string& id) const;
    ArchetypeLookup resolve(const std::string& id) const;
    bool contains(const std::string& id) const;

    // Catalog order (built-ins first, then loaded additions).
    const std::vector<ArchetypeDef>& all() const { return defs_; }
    const std::string& defaultId() const { return defaultId_; }

    // Replaces the record with the same id, or appends a new one.
    void upsert(ArchetypeDef def);
    // Ignored when `id` is not in the catalog.
    bool setDefault(const std::string& id);

private:
    const ArchetypeDef& fallbackRecord() const;

    std::vector<ArchetypeDef> defs_;
    std::unordered_map<std::string, std::size_t> index_;
    std::string defaultId_;
};

// The fourteen built-in archetypes.
std::vector<ArchetypeDef> defaultArchetypes();

}  // namespace Forge::Content
