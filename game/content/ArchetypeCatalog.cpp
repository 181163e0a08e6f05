// Built-in archetype data and catalog lookups.
#include "ArchetypeCatalog.h"

#include <utility>

namespace Forge::Content {

namespace {
using C = Rules::Characteristic;
}  // namespace

std::vector<ArchetypeDef> defaultArchetypes() {
    return {
        {"aggressive-fighter", "Aggressive Fighter", "Melee combatant focused on dealing damage",
         {C::WS, C::S, C::T}, {C::Ag, C::I, C::WP}, {C::BS, C::Dex, C::Int, C::Fel},
         {"Melee (Basic)", "Melee (Brawling)", "Dodge", "Intimidate", "Endurance"},
         {"Strike Mighty Blow", "Combat Reflexes", "Fearless", "Warrior Born", "Strike to Injure"},
         "Soldier"},
        {"ranged-combatant", "Ranged Combatant", "Expert with bows, crossbows, and firearms",
         {C::BS, C::Dex, C::Ag}, {C::I, C::Int, C::WS}, {C::S, C::T, C::WP, C::Fel},
         {"Ranged (Bow)", "Ranged (Crossbow)", "Perception", "Track", "Dodge"},
         {"Sharpshooter", "Marksman", "Rapid Reload", "Sure Shot", "Fast Shot"},
         "Huntsman"},
        {"defensive-warrior", "Defensive Warrior", "Tank focused on absorbing damage and protecting others",
         {C::T, C::WP, C::S}, {C::WS, C::Ag, C::I}, {C::BS, C::Dex, C::Int, C::Fel},
         {"Melee (Basic)", "Endurance", "Cool", "Dodge", "Melee (Parry)"},
         {"Shieldmaster", "Tenacious", "Robust", "Iron Jaw", "Resolute"},
         "Pit Fighter"},
        {"agile-rogue", "Agile Rogue", "Quick and nimble, specializes in evasion and mobility",
         {C::Ag, C::Dex, C::I}, {C::WS, C::BS, C::Fel}, {C::S, C::T, C::Int, C::WP},
         {"Stealth (Urban)", "Climb", "Athletics", "Dodge", "Perception"},
         {"Catfall", "Fleet Footed", "Nimble Fingered", "Step Aside", "Sprint"},
         "Thief"},
        {"cunning-thief", "Cunning Thief", "Master of stealth, lockpicking, and deception",
         {C::Dex, C::Int, C::Fel}, {C::Ag, C::I, C::WP}, {C::WS, C::BS, C::S, C::T},
         {"Sleight of Hand", "Pick Lock", "Stealth (Urban)", "Charm", "Perception"},
         {"Nimble Fingered", "Luck", "Shadow", "Criminal", "Etiquette (Criminals)"},
         "Thief"},
        {"wise-priest", "Wise Priest", "Divine spellcaster and spiritual leader",
         {C::WP, C::Int, C::Fel}, {C::T, C::I, C::Ag}, {C::WS, C::BS, C::S, C::Dex},
         {"Pray", "Lore (Theology)", "Heal", "Intuition", "Cool"},
         {"Bless", "Holy Visions", "Savvy", "Read/Write", "Etiquette (Cultists)"},
         "Priest"},
        {"powerful-wizard", "Powerful Wizard", "Arcane spellcaster with devastating magic",
         {C::Int, C::WP, C::I}, {C::Dex, C::Fel, C::Ag}, {C::WS, C::BS, C::S, C::T},
         {"Channelling", "Language (Magick)", "Lore (Magic)", "Intuition", "Perception"},
         {"Aethyric Attunement", "Instinctive Diction", "Magical Sense", "Petty Magic", "Arcane Magic"},
         "Wizard"},
        {"charismatic-leader", "Charismatic Leader", "Natural leader who inspires and commands others",
         {C::Fel, C::WP, C::Int}, {C::I, C::Ag, C::T}, {C::WS, C::BS, C::S, C::Dex},
         {"Leadership", "Charm", "Intimidate", "Intuition", "Lore (Heraldry)"},
         {"Inspiring", "Read/Write", "Etiquette (Nobles)", "Savvy", "Noble Blood"},
         "Noble"},
        {"scholarly-sage", "Scholarly Sage", "Expert in knowledge and lore",
         {C::Int, C::WP, C::I}, {C::Fel, C::Dex, C::Ag}, {C::WS, C::BS, C::S, C::T},
         {"Lore (History)", "Lore (Theology)", "Research", "Language (Classical)", "Perception"},
         {"Read/Write", "Savvy", "Linguistics", "Bookish", "Etiquette (Scholars)"},
         "Scholar"},
        {"hardy-survivalist", "Hardy Survivalist", "Wilderness expert and tracker",
         {C::T, C::S, C::I}, {C::Ag, C::Int, C::BS}, {C::WS, C::Dex, C::WP, C::Fel},
         {"Track", "Outdoor Survival", "Animal Care", "Endurance", "Perception"},
         {"Rover", "Tenacious", "Hardy", "Trapper", "Strider"},
         "Scout"},
        {"brutal-berserker", "Brutal Berserker", "Raging warrior who sacrifices defense for overwhelming offense",
         {C::S, C::WS, C::T}, {C::Ag, C::WP, C::I}, {C::BS, C::Dex, C::Int, C::Fel},
         {"Melee (Two-handed)", "Melee (Basic)", "Intimidate", "Endurance", "Consume Alcohol"},
         {"Frenzy", "Strike Mighty Blow", "Fearless", "Very Strong", "Furious Assault"},
         "Berserker"},
        {"swift-duelist", "Swift Duelist", "Finesse fighter using speed and precision",
         {C::Ag, C::I, C::WS}, {C::Dex, C::Fel, C::T}, {C::BS, C::S, C::Int, C::WP},
         {"Melee (Fencing)", "Dodge", "Athletics", "Cool", "Perception"},
         {"Combat Reflexes", "Ambidextrous", "Strike to Stun", "Lightning Reflexes", "Reaction Strike"},
         "Duellist"},
        {"intimidating-thug", "Intimidating Thug", "Brutal enforcer who uses fear and violence",
         {C::S, C::T, C::Fel}, {C::WS, C::WP, C::Ag}, {C::BS, C::I, C::Dex, C::Int},
         {"Intimidate", "Melee (Brawling)", "Endurance", "Consume Alcohol", "Cool"},
         {"Menacing", "Strike Mighty Blow", "Criminal", "Dirty Fighting", "Fearless"},
         "Bounty Hunter"},
        {"sneaky-assassin", "Sneaky Assassin", "Silent killer specializing in lethal precision strikes",
         {C::Ag, C::Dex, C::WS}, {C::I, C::Int, C::BS}, {C::S, C::T, C::WP, C::Fel},
         {"Stealth (Urban)", "Melee (Basic)", "Ranged (Throwing)", "Perception", "Climb"},
         {"Assassin", "Strike to Stun", "Shadow", "Backstab", "Accurate Shot"},
         "Assassin"},
    };
}

ArchetypeCatalog::ArchetypeCatalog() : ArchetypeCatalog(defaultArchetypes()) {}

ArchetypeCatalog::ArchetypeCatalog(std::vector<ArchetypeDef> defs, std::string defaultId)
    : defaultId_(std::move(defaultId)) {
    for (auto& def : defs) upsert(std::move(def));
    if (!contains(defaultId_) && !defs_.empty()) defaultId_ = defs_.front().id;
}

const ArchetypeDef& ArchetypeCatalog::get(const std::string& id) const { return *resolve(id).archetype; }

ArchetypeLookup ArchetypeCatalog::resolve(const std::string& id) const {
    auto it = index_.find(id);
    if (it != index_.end()) return {&defs_[it->second], false};
    return {&fallbackRecord(), true};
}

bool ArchetypeCatalog::contains(const std::string& id) const { return index_.count(id) > 0; }

void ArchetypeCatalog::upsert(ArchetypeDef def) {
    auto it = index_.find(def.id);
    if (it != index_.end()) {
        defs_[it->second] = std::move(def);
        return;
    }
    index_[def.id] = defs_.size();
    defs_.push_back(std::move(def));
}

bool ArchetypeCatalog::setDefault(const std::string& id) {
    if (!contains(id)) return false;
    defaultId_ = id;
    return true;
}

const ArchetypeDef& ArchetypeCatalog::fallbackRecord() const {
    auto it = index_.find(defaultId_);
    if (it != index_.end()) return defs_[it->second];
    if (!defs_.empty()) return defs_.front();
    static const ArchetypeDef kEmpty{};
    return kEmpty;
}

}  // namespace Forge::Content
