#include "EquipmentAdvisor.h"

#include <utility>

namespace Forge::Content {

std::unordered_map<std::string, std::vector<std::string>> defaultEquipmentKits() {
    return {
        {"aggressive-fighter",
         {"Hand Weapon (Sword or Axe)", "Shield", "Mail Shirt (3 AP Body)", "Leather Jack (1 AP Arms, Legs)",
          "Helmet (2 AP Head)"}},
        {"ranged-combatant", {"Bow or Crossbow", "20 Arrows/Bolts", "Dagger", "Leather Jerkin (1 AP Body)", "Cloak"}},
        {"defensive-warrior", {"Hand Weapon", "Shield", "Full Plate (5 AP All Locations)", "Helmet", "Great Weapon"}},
        {"agile-rogue", {"Dagger", "Rope (10 yards)", "Grappling Hook", "Dark Clothing", "Lockpicks"}},
        {"cunning-thief", {"Dagger", "Sling and Stones", "Lockpicks", "Dark Cloak", "Crowbar"}},
        {"wise-priest", {"Religious Symbol", "Staff", "Religious Text", "Healing Draught", "Robes"}},
        {"powerful-wizard", {"Wizard's Staff", "Grimoire", "Arcane Focus", "Component Pouch", "Robes"}},
        {"charismatic-leader",
         {"Quality Sword", "Noble Clothing", "Signet Ring", "Letter of Introduction", "Fine Wine"}},
        {"scholarly-sage", {"Multiple Books", "Writing Kit", "Reading Glasses", "Scholar's Robes", "Lantern"}},
        {"hardy-survivalist", {"Bow", "Hunting Knife", "Rope", "Tent and Bedroll", "Rations (1 week)"}},
        {"brutal-berserker",
         {"Great Axe or Great Hammer", "No Armor (frenzied)", "Healing Draught", "Trophy Necklace",
          "Alcohol (plentiful)"}},
        {"swift-duelist", {"Rapier", "Main Gauche", "Leather Jerkin", "Fine Clothing", "Dueling Gloves"}},
        {"intimidating-thug", {"Cudgel or Knuckledusters", "Leather Jack", "Manacles", "Flask of Spirits", "Hood"}},
        {"sneaky-assassin", {"Poisoned Dagger", "Garrote", "Throwing Knives (3)", "Dark Clothing", "Poison Kit"}},
    };
}

EquipmentAdvisor::EquipmentAdvisor() : EquipmentAdvisor(defaultEquipmentKits()) {}

EquipmentAdvisor::EquipmentAdvisor(std::unordered_map<std::string, std::vector<std::string>> kits,
                                   std::string fallbackId)
    : kits_(std::move(kits)), fallbackId_(std::move(fallbackId)) {}

const std::vector<std::string>& EquipmentAdvisor::suggest(const std::string& archetypeId) const {
    auto it = kits_.find(archetypeId);
    if (it != kits_.end()) return it->second;
    it = kits_.find(fallbackId_);
    if (it != kits_.end()) return it->second;
    static const std::vector<std::string> kNone;
    return kNone;
}

bool EquipmentAdvisor::contains(const std::string& archetypeId) const { return kits_.count(archetypeId) > 0; }

void EquipmentAdvisor::set(const std::string& archetypeId, std::vector<std::string> items) {
    kits_[archetypeId] = std::move(items);
}

}  // namespace Forge::Content
