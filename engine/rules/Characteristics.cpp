#include "Characteristics.h"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace Forge::Rules {

namespace {
struct CharacteristicInfo {
    std::string_view key;
    std::string_view name;
};

constexpr std::array<CharacteristicInfo, kCharacteristicCount> kInfo{{
    {"ws", "Weapon Skill"},
    {"bs", "Ballistic Skill"},
    {"s", "Strength"},
    {"t", "Toughness"},
    {"i", "Initiative"},
    {"ag", "Agility"},
    {"dex", "Dexterity"},
    {"int", "Intelligence"},
    {"wp", "Willpower"},
    {"fel", "Fellowship"},
}};
}  // namespace

const std::array<Characteristic, kCharacteristicCount>& allCharacteristics() {
    static const std::array<Characteristic, kCharacteristicCount> kAll = {
        Characteristic::WS, Characteristic::BS,  Characteristic::S,   Characteristic::T,  Characteristic::I,
        Characteristic::Ag, Characteristic::Dex, Characteristic::Int, Characteristic::WP, Characteristic::Fel,
    };
    return kAll;
}

std::string_view characteristicKey(Characteristic c) {
    if (c == Characteristic::Count) return "";
    return kInfo[indexOf(c)].key;
}

std::string_view characteristicName(Characteristic c) {
    if (c == Characteristic::Count) return "";
    return kInfo[indexOf(c)].name;
}

std::string characteristicLabel(Characteristic c) {
    std::string out(characteristicKey(c));
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    return out;
}

std::optional<Characteristic> parseCharacteristicKey(std::string_view key) {
    std::string lowered(key);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    for (std::size_t i = 0; i < kInfo.size(); ++i) {
        if (kInfo[i].key == lowered) return static_cast<Characteristic>(i);
    }
    return std::nullopt;
}

int characteristicBonus(int value) {
    // floor, not truncation: a negative value still rounds down.
    return static_cast<int>(std::floor(static_cast<double>(value) / 10.0));
}

}  // namespace Forge::Rules
