// The ten WFRP characteristics and helpers for their short keys and display names.
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace Forge::Rules {

// Canonical order; also the order used for reports and payloads.
enum class Characteristic : std::uint8_t {
    WS = 0,  // Weapon Skill
    BS,      // Ballistic Skill
    S,       // Strength
    T,       // Toughness
    I,       // Initiative
    Ag,      // Agility
    Dex,     // Dexterity
    Int,     // Intelligence
    WP,      // Willpower
    Fel,     // Fellowship
    Count
};

constexpr std::size_t kCharacteristicCount = static_cast<std::size_t>(Characteristic::Count);

template <typename T>
using CharacteristicArray = std::array<T, kCharacteristicCount>;

constexpr std::size_t indexOf(Characteristic c) { return static_cast<std::size_t>(c); }

// All characteristics in canonical order, for range-for loops.
const std::array<Characteristic, kCharacteristicCount>& allCharacteristics();

// Lower-case key ("ws", "dex", ...).
std::string_view characteristicKey(Characteristic c);
// Full name ("Weapon Skill", ...).
std::string_view characteristicName(Characteristic c);
// Upper-case key used in compact listings ("WS", "DEX", ...).
std::string characteristicLabel(Characteristic c);

// Accepts keys case-insensitively; nullopt for anything else.
std::optional<Characteristic> parseCharacteristicKey(std::string_view key);

// Characteristic bonus: tens digit of the value.
int characteristicBonus(int value);

}  // namespace Forge::Rules
