#include "SkillTable.h"

namespace Forge::Content {

Rules::SkillLinks defaultSkillLinks() {
    using C = Rules::Characteristic;
    Rules::SkillLinks out{};
    out.fallback = C::WS;
    out.links = {
        {"Melee (Basic)", C::WS},
        {"Melee (Brawling)", C::WS},
        {"Melee (Cavalry)", C::WS},
        {"Melee (Fencing)", C::WS},
        {"Melee (Flail)", C::WS},
        {"Melee (Parry)", C::WS},
        {"Melee (Polearm)", C::WS},
        {"Melee (Two-handed)", C::WS},
        {"Ranged (Bow)", C::BS},
        {"Ranged (Crossbow)", C::BS},
        {"Ranged (Blackpowder)", C::BS},
        {"Ranged (Engineering)", C::BS},
        {"Ranged (Entangling)", C::BS},
        {"Ranged (Explosives)", C::BS},
        {"Ranged (Sling)", C::BS},
        {"Ranged (Throwing)", C::BS},
        {"Athletics", C::Ag},
        {"Climb", C::Ag},
        {"Dodge", C::Ag},
        {"Stealth (Urban)", C::Ag},
        {"Stealth (Rural)", C::Ag},
        {"Endurance", C::T},
        {"Consume Alcohol", C::T},
        {"Perception", C::I},
        {"Track", C::I},
        {"Intuition", C::I},
        {"Pick Lock", C::Dex},
        {"Sleight of Hand", C::Dex},
        {"Channelling", C::WP},
        {"Cool", C::WP},
        {"Pray", C::WP},
        {"Leadership", C::Fel},
        {"Charm", C::Fel},
        {"Intimidate", C::Fel},
        {"Animal Care", C::Int},
        {"Language (Magick)", C::Int},
        {"Language (Classical)", C::Int},
        {"Lore (History)", C::Int},
        {"Lore (Magic)", C::Int},
        {"Lore (Theology)", C::Int},
        {"Lore (Heraldry)", C::Int},
        {"Research", C::Int},
        {"Heal", C::Int},
        {"Outdoor Survival", C::Int},
    };
    return out;
}

}  // namespace Forge::Content
