// Plain data records shared by the allocation engine and the content catalogs.
#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "Characteristics.h"

namespace Forge::Rules {

// Weighting profile for a generated NPC.
struct ArchetypeDef {
    std::string id;
    std::string name;
    std::string description;
    std::vector<Characteristic> primary;
    std::vector<Characteristic> secondary;
    std::vector<Characteristic> tertiary;
    std::vector<std::string> favoredSkills;
    std::vector<std::string> favoredTalents;
    std::string suggestedCareer;
};

enum class PriorityTier { Primary, Secondary, Tertiary };

// Tier of `c` in `archetype`; characteristics missing from every list count as tertiary.
PriorityTier priorityOf(const ArchetypeDef& archetype, Characteristic c);

enum class WoundsFormula {
    StrengthToughnessWillpower,  // SB + 2*TB + WPB
    ToughnessWillpower,          // 2*TB + WPB (halflings)
};

struct SpeciesDef {
    std::string id;
    std::string name;
    CharacteristicArray<int> baseline{};
    int movement{4};
    int fortune{2};
    int fate{2};
    std::vector<std::string> intrinsicTalents;
    WoundsFormula wounds{WoundsFormula::StrengthToughnessWillpower};
};

// Skill name -> governing characteristic.
struct SkillLinks {
    std::unordered_map<std::string, Characteristic> links;
    Characteristic fallback{Characteristic::WS};

    Characteristic linkedTo(const std::string& skillName) const;
    bool contains(const std::string& skillName) const;
};

struct CharacteristicAllocation {
    int base{0};
    int advances{0};
    int final{0};
    int xpSpent{0};
};

struct SkillAllocation {
    std::string name;
    int advances{0};
    int total{0};
    int xpSpent{0};
    Characteristic linkedCharacteristic{Characteristic::WS};
};

struct TalentAllocation {
    std::string name;
    int rank{1};
    int xpSpent{0};
    bool intrinsic{false};
};

struct AllocationSummary {
    int characteristicsXP{0};
    int skillsXP{0};
    int talentsXP{0};
    int totalSpent{0};
    int remaining{0};
};

struct AllocationResult {
    int totalBudget{0};
    CharacteristicArray<CharacteristicAllocation> characteristics{};
    std::vector<SkillAllocation> skills;
    std::vector<TalentAllocation> talents;
    AllocationSummary summary{};

    const CharacteristicAllocation& at(Characteristic c) const { return characteristics[indexOf(c)]; }
};

bool operator==(const CharacteristicAllocation& a, const CharacteristicAllocation& b);
bool operator==(const SkillAllocation& a, const SkillAllocation& b);
bool operator==(const TalentAllocation& a, const TalentAllocation& b);
bool operator==(const AllocationSummary& a, const AllocationSummary& b);
bool operator==(const AllocationResult& a, const AllocationResult& b);
inline bool operator!=(const AllocationResult& a, const AllocationResult& b) { return !(a == b); }

}  // namespace Forge::Rules
