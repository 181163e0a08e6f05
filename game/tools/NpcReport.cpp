#include "NpcReport.h"

#include <cctype>
#include <cmath>
#include <sstream>

namespace Forge::Tools {

using Rules::Characteristic;
using Rules::PriorityTier;

namespace {

std::string joinLabels(const std::vector<Characteristic>& list) {
    std::string out;
    for (std::size_t i = 0; i < list.size(); ++i) {
        if (i > 0) out += ", ";
        out += Rules::characteristicLabel(list[i]);
    }
    return out;
}

std::string joinStrings(const std::vector<std::string>& list, std::size_t limit) {
    std::string out;
    for (std::size_t i = 0; i < list.size() && i < limit; ++i) {
        if (i > 0) out += ", ";
        out += list[i];
    }
    return out;
}

int percent(double share) { return static_cast<int>(std::floor(share * 100.0 + 0.5)); }

const char* priorityMarker(const Rules::ArchetypeDef& archetype, Characteristic c) {
    switch (Rules::priorityOf(archetype, c)) {
        case PriorityTier::Primary:
            return " ★";
        case PriorityTier::Secondary:
            return " ✦";
        case PriorityTier::Tertiary:
        default:
            return "";
    }
}

}  // namespace

std::string capitalize(const std::string& text) {
    if (text.empty()) return text;
    std::string out = text;
    out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
    return out;
}

int spendEfficiencyPercent(const Rules::AllocationSummary& summary, int totalBudget) {
    if (totalBudget <= 0) return 0;
    const double ratio = static_cast<double>(summary.totalSpent) / static_cast<double>(totalBudget);
    return static_cast<int>(std::floor(ratio * 100.0 + 0.5));
}

std::string renderNpcReport(const GeneratedNpc& npc, const Content::TalentCatalog& talents,
                            const std::optional<std::string>& actorId) {
    const auto& req = npc.request;
    const auto& alloc = npc.allocation;
    std::ostringstream out;

    if (actorId) {
        out << "**Custom NPC Created: " << req.name << "**\n\n";
        out << "**Actor ID**: " << *actorId << "\n";
        out << "The NPC has been created with all characteristics, skills, and talents.\n\n";
    } else {
        out << "**Custom NPC Preview: " << req.name << "**\n\n";
    }

    out << "**Species:** " << capitalize(npc.species.id) << "\n";
    out << "**Archetype:** " << npc.archetype.name << "\n";
    if (req.career) {
        out << "**Career:** " << *req.career << "\n";
    } else {
        out << "**Suggested Career:** " << npc.archetype.suggestedCareer << "\n";
    }
    out << "**Total XP:** " << req.totalXP << "\n";
    if (req.description) out << "**Description:** " << *req.description << "\n";
    out << "\n";

    out << "## Characteristics\n";
    for (Characteristic c : Rules::allCharacteristics()) {
        const auto& data = alloc.at(c);
        out << "- **" << Rules::characteristicName(c) << "**: " << data.final << " (base " << data.base << ", +"
            << data.advances << " advances, " << data.xpSpent << " XP)" << priorityMarker(npc.archetype, c)
            << "\n";
    }

    out << "\n## Skills\n";
    if (alloc.skills.empty()) {
        out << "*No skills acquired with this XP budget*\n";
    } else {
        for (const auto& skill : alloc.skills) {
            out << "- **" << skill.name << "**: " << skill.total << "% (+" << skill.advances << " advances, "
                << skill.xpSpent << " XP)\n";
        }
    }

    out << "\n## Talents\n";
    if (alloc.talents.empty()) {
        out << "*No talents acquired with this XP budget*\n";
    } else {
        for (const auto& talent : alloc.talents) {
            out << "- **" << talent.name << "**";
            if (talent.rank > 1) out << " (Rank " << talent.rank << ")";
            out << " - " << talents.describe(talent.name) << "\n";
        }
    }

    if (!req.personalityTraits.empty()) {
        out << "\n## Personality Traits\n";
        for (const auto& trait : req.personalityTraits) out << "- " << capitalize(trait) << "\n";
    }

    out << "\n## Suggested Equipment\n";
    for (const auto& item : npc.equipment) out << "- " << item << "\n";

    const auto& s = alloc.summary;
    out << "\n## XP Breakdown\n";
    out << "- **Characteristics:** " << s.characteristicsXP << " XP\n";
    out << "- **Skills:** " << s.skillsXP << " XP\n";
    out << "- **Talents:** " << s.talentsXP << " XP\n";
    out << "- **Total Spent:** " << s.totalSpent << " XP\n";
    out << "- **Remaining:** " << s.remaining << " XP\n";

    out << "\n## Derived Statistics\n";
    out << "- **Wounds:** " << npc.derived.wounds << "\n";
    out << "- **Movement:** " << npc.derived.movement << "\n";
    out << "- **Fortune Points:** " << npc.derived.fortune << "\n";
    out << "- **Fate Points:** " << npc.derived.fate << "\n";
    out << "- **Resilience:** " << npc.derived.resilience << "\n";

    out << "\n---\n";
    if (actorId) {
        out << "NPC successfully created. \"" << req.name << "\" is now in the Actors directory.";
    } else {
        out << "**Note:** This is a preview. Pass --payload to emit the actor and item data for the game session.";
    }
    return out.str();
}

std::string renderArchetypeList(const Content::ArchetypeCatalog& archetypes, const Rules::AllocationRules& rules) {
    std::ostringstream out;
    out << "**WFRP 4e NPC Archetypes**\n\n";
    out << "Use these archetypes with `create` to generate balanced NPCs.\n\n";

    for (const auto& a : archetypes.all()) {
        out << "## " << a.name << "\n";
        out << "**ID:** `" << a.id << "`\n";
        out << "**Description:** " << a.description << "\n";
        out << "**Suggested Career:** " << a.suggestedCareer << "\n\n";
        out << "**Primary Characteristics** (" << percent(rules.primaryShare) << "% of XP): " << joinLabels(a.primary)
            << "\n";
        out << "**Secondary Characteristics** (" << percent(rules.secondaryShare)
            << "% of XP): " << joinLabels(a.secondary) << "\n";
        out << "**Tertiary Characteristics** (" << percent(rules.tertiaryShare)
            << "% of XP): " << joinLabels(a.tertiary) << "\n\n";
        out << "**Key Skills:** " << joinStrings(a.favoredSkills, a.favoredSkills.size()) << "\n";
        out << "**Typical Talents:** " << joinStrings(a.favoredTalents, 3) << "\n";
        out << "\n---\n\n";
    }

    out << "**XP Guidelines:**\n";
    out << "- **500-1000 XP**: Novice (starting adventurer level)\n";
    out << "- **1000-2000 XP**: Experienced (seasoned professional)\n";
    out << "- **2000-4000 XP**: Veteran (battle-hardened expert)\n";
    out << "- **4000+ XP**: Master (legendary hero level)\n";
    return out.str();
}

std::string renderDistributionPreview(const GeneratedNpc& npc) {
    const auto& alloc = npc.allocation;
    const auto& s = alloc.summary;
    std::ostringstream out;

    out << "**XP Distribution Preview: " << npc.archetype.name << "**\n\n";
    out << "**Total XP Budget:** " << alloc.totalBudget << "\n\n";

    out << "## Characteristics (" << s.characteristicsXP << " XP)\n";
    for (Characteristic c : Rules::allCharacteristics()) {
        const auto& data = alloc.at(c);
        if (data.advances == 0) continue;
        out << "- **" << Rules::characteristicLabel(c) << "**: " << data.base << " → " << data.final << " (+"
            << data.advances << ", " << data.xpSpent << " XP)\n";
    }

    out << "\n## Skills (" << s.skillsXP << " XP)\n";
    if (alloc.skills.empty()) {
        out << "*No skills with this XP budget*\n";
    } else {
        for (const auto& skill : alloc.skills) {
            out << "- **" << skill.name << "**: +" << skill.advances << " advances (" << skill.xpSpent << " XP) → "
                << skill.total << "%\n";
        }
    }

    out << "\n## Talents (" << s.talentsXP << " XP)\n";
    if (alloc.talents.empty()) {
        out << "*No talents with this XP budget*\n";
    } else {
        for (const auto& talent : alloc.talents) {
            out << "- **" << talent.name << "**";
            if (talent.rank > 1) out << " (Rank " << talent.rank << ")";
            out << " (" << talent.xpSpent << " XP)\n";
        }
    }

    out << "\n## Summary\n";
    out << "- **Total Spent:** " << s.totalSpent << " XP\n";
    out << "- **Remaining:** " << s.remaining << " XP\n";
    out << "- **Efficiency:** " << spendEfficiencyPercent(s, alloc.totalBudget) << "%\n";
    return out.str();
}

}  // namespace Forge::Tools
