// JSON loaders that overlay data files onto the built-in NPC content.
#include "ContentBundle.h"

#include <filesystem>
#include <fstream>
#include <optional>
#include <system_error>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

#include "../../engine/core/Logger.h"

namespace Forge::Content {

using nlohmann::json;
using Rules::Characteristic;
using Rules::CostSchedule;

namespace {

std::optional<json> readJsonFile(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (ec) {
            logWarn("Unable to stat content file " + path + ": " + ec.message());
        } else {
            logDebug("Content file not found, keeping defaults: " + path);
        }
        return std::nullopt;
    }
    std::ifstream f(path);
    if (!f.is_open()) {
        logWarn("Unable to open content file: " + path);
        return std::nullopt;
    }
    json j;
    try {
        f >> j;
    } catch (const json::exception& e) {
        logWarn("Malformed content file " + path + ": " + e.what());
        return std::nullopt;
    }
    if (!j.is_object()) {
        logWarn("Content file " + path + " must hold a JSON object");
        return std::nullopt;
    }
    return j;
}

std::vector<std::string> readStrings(const json& arr) {
    std::vector<std::string> out;
    if (!arr.is_array()) return out;
    for (const auto& v : arr) {
        if (v.is_string()) out.push_back(v.get<std::string>());
    }
    return out;
}

// nullopt when any entry is not a known characteristic key.
std::optional<std::vector<Characteristic>> readCharacteristics(const json& arr) {
    std::vector<Characteristic> out;
    if (!arr.is_array()) return std::nullopt;
    for (const auto& v : arr) {
        if (!v.is_string()) return std::nullopt;
        auto c = Rules::parseCharacteristicKey(v.get<std::string>());
        if (!c) return std::nullopt;
        out.push_back(*c);
    }
    return out;
}

std::optional<CostSchedule> readSchedule(const json& arr) {
    if (!arr.is_array() || arr.empty()) return std::nullopt;
    CostSchedule s{};
    for (const auto& v : arr) {
        if (!v.is_number_integer() || v.get<int>() <= 0) return std::nullopt;
        s.costs.push_back(v.get<int>());
    }
    return s;
}

bool isFraction(double v) { return v >= 0.0 && v <= 1.0; }

}  // namespace

bool loadAllocationRules(const std::string& path, Rules::AllocationRules& out) {
    auto doc = readJsonFile(path);
    if (!doc) return false;
    const json& j = *doc;

    Rules::AllocationRules rules = out;
    try {
        if (j.contains("characteristicCosts")) {
            auto s = readSchedule(j["characteristicCosts"]);
            if (!s) {
                logWarn("rules: characteristicCosts must be a non-empty list of positive integers");
                return false;
            }
            rules.characteristicCosts = *s;
        }
        if (j.contains("skillCosts")) {
            auto s = readSchedule(j["skillCosts"]);
            if (!s) {
                logWarn("rules: skillCosts must be a non-empty list of positive integers");
                return false;
            }
            rules.skillCosts = *s;
        }
        rules.talentCost = j.value("talentCost", rules.talentCost);
        rules.advanceCap = j.value("advanceCap", rules.advanceCap);
        if (j.contains("categoryFractions")) {
            const auto& f = j["categoryFractions"];
            rules.characteristicFraction = f.value("characteristics", rules.characteristicFraction);
            rules.skillFraction = f.value("skills", rules.skillFraction);
        }
        if (j.contains("tierShares")) {
            const auto& t = j["tierShares"];
            rules.primaryShare = t.value("primary", rules.primaryShare);
            rules.secondaryShare = t.value("secondary", rules.secondaryShare);
            rules.tertiaryShare = t.value("tertiary", rules.tertiaryShare);
        }
    } catch (const json::exception& e) {
        logWarn("rules: " + path + ": " + e.what());
        return false;
    }

    if (rules.talentCost <= 0 || rules.advanceCap < 0) {
        logWarn("rules: talentCost must be positive and advanceCap non-negative");
        return false;
    }
    if (!isFraction(rules.characteristicFraction) || !isFraction(rules.skillFraction) ||
        rules.characteristicFraction + rules.skillFraction > 1.0) {
        logWarn("rules: category fractions must lie in [0, 1] and sum to at most 1");
        return false;
    }
    if (!isFraction(rules.primaryShare) || !isFraction(rules.secondaryShare) || !isFraction(rules.tertiaryShare) ||
        rules.primaryShare + rules.secondaryShare + rules.tertiaryShare > 1.0 + 1e-9) {
        logWarn("rules: tier shares must lie in [0, 1] and sum to at most 1");
        return false;
    }
    out = rules;
    return true;
}

bool loadArchetypes(const std::string& path, ArchetypeCatalog& out) {
    auto doc = readJsonFile(path);
    if (!doc) return false;
    const json& j = *doc;
    if (!j.contains("archetypes") || !j["archetypes"].is_array()) {
        logWarn("archetypes: " + path + " has no 'archetypes' list");
        return false;
    }
    int loaded = 0;
    for (const auto& a : j["archetypes"]) {
        try {
            ArchetypeDef def{};
            def.id = a.value("id", "");
            if (def.id.empty()) {
                logWarn("archetypes: skipping record without id");
                continue;
            }
            def.name = a.value("name", def.id);
            def.description = a.value("description", "");
            bool tiersOk = true;
            auto readTier = [&](const char* key, std::vector<Characteristic>& dst) {
                if (!a.contains(key)) return;
                auto tier = readCharacteristics(a[key]);
                if (tier) {
                    dst = std::move(*tier);
                } else {
                    tiersOk = false;
                }
            };
            readTier("primary", def.primary);
            readTier("secondary", def.secondary);
            readTier("tertiary", def.tertiary);
            if (!tiersOk) {
                logWarn("archetypes: skipping '" + def.id + "' (tiers must list characteristic keys)");
                continue;
            }
            if (a.contains("skills")) def.favoredSkills = readStrings(a["skills"]);
            if (a.contains("talents")) def.favoredTalents = readStrings(a["talents"]);
            def.suggestedCareer = a.value("suggestedCareer", "");
            out.upsert(std::move(def));
            ++loaded;
        } catch (const json::exception& e) {
            logWarn("archetypes: skipping malformed record: " + std::string(e.what()));
        }
    }
    if (j.contains("default") && j["default"].is_string()) {
        const auto id = j["default"].get<std::string>();
        if (!out.setDefault(id)) logWarn("archetypes: default '" + id + "' is not in the catalog");
    }
    logDebug("Loaded " + std::to_string(loaded) + " archetypes from " + path);
    return true;
}

bool loadSpecies(const std::string& path, SpeciesCatalog& out) {
    auto doc = readJsonFile(path);
    if (!doc) return false;
    const json& j = *doc;
    if (!j.contains("species") || !j["species"].is_array()) {
        logWarn("species: " + path + " has no 'species' list");
        return false;
    }
    int loaded = 0;
    for (const auto& s : j["species"]) {
        try {
            const std::string id = s.value("id", "");
            if (id.empty()) {
                logWarn("species: skipping record without id");
                continue;
            }
            // Partial records start from the existing entry (or the plain human baseline).
            SpeciesDef def = out.contains(id) ? out.get(id) : baselineHuman();
            def.id = id;
            def.name = s.value("name", out.contains(id) ? def.name : id);
            if (s.contains("characteristics")) {
                for (const auto& kv : s["characteristics"].items()) {
                    auto c = Rules::parseCharacteristicKey(kv.key());
                    if (!c) {
                        logWarn("species: " + id + ": ignoring unknown characteristic '" + kv.key() + "'");
                        continue;
                    }
                    def.baseline[Rules::indexOf(*c)] = kv.value().get<int>();
                }
            }
            def.movement = s.value("movement", def.movement);
            def.fortune = s.value("fortune", def.fortune);
            def.fate = s.value("fate", def.fate);
            if (s.contains("talents")) def.intrinsicTalents = readStrings(s["talents"]);
            if (s.contains("wounds")) {
                const auto formula = s["wounds"].get<std::string>();
                if (formula == "toughness-willpower") {
                    def.wounds = Rules::WoundsFormula::ToughnessWillpower;
                } else if (formula == "strength-toughness-willpower") {
                    def.wounds = Rules::WoundsFormula::StrengthToughnessWillpower;
                } else {
                    logWarn("species: " + id + ": unknown wounds formula '" + formula + "'");
                }
            }
            out.upsert(std::move(def));
            ++loaded;
        } catch (const json::exception& e) {
            logWarn("species: skipping malformed record: " + std::string(e.what()));
        }
    }
    logDebug("Loaded " + std::to_string(loaded) + " species from " + path);
    return true;
}

bool loadSkillLinks(const std::string& path, Rules::SkillLinks& out) {
    auto doc = readJsonFile(path);
    if (!doc) return false;
    const json& j = *doc;
    if (j.contains("fallback") && j["fallback"].is_string()) {
        auto c = Rules::parseCharacteristicKey(j["fallback"].get<std::string>());
        if (c) {
            out.fallback = *c;
        } else {
            logWarn("skills: unknown fallback characteristic, keeping " +
                    std::string(Rules::characteristicKey(out.fallback)));
        }
    }
    if (j.contains("skills") && j["skills"].is_object()) {
        for (const auto& kv : j["skills"].items()) {
            auto c = kv.value().is_string() ? Rules::parseCharacteristicKey(kv.value().get<std::string>())
                                            : std::nullopt;
            if (!c) {
                logWarn("skills: skipping '" + kv.key() + "' (value must be a characteristic key)");
                continue;
            }
            out.links[kv.key()] = *c;
        }
    }
    return true;
}

bool loadTalents(const std::string& path, TalentCatalog& out) {
    auto doc = readJsonFile(path);
    if (!doc) return false;
    const json& j = *doc;
    if (!j.contains("talents") || !j["talents"].is_object()) {
        logWarn("talents: " + path + " has no 'talents' object");
        return false;
    }
    for (const auto& kv : j["talents"].items()) {
        if (!kv.value().is_string()) {
            logWarn("talents: skipping '" + kv.key() + "' (description must be a string)");
            continue;
        }
        out.set(kv.key(), kv.value().get<std::string>());
    }
    return true;
}

bool loadEquipment(const std::string& path, EquipmentAdvisor& out) {
    auto doc = readJsonFile(path);
    if (!doc) return false;
    const json& j = *doc;
    if (!j.contains("equipment") || !j["equipment"].is_object()) {
        logWarn("equipment: " + path + " has no 'equipment' object");
        return false;
    }
    for (const auto& kv : j["equipment"].items()) {
        if (!kv.value().is_array()) {
            logWarn("equipment: skipping '" + kv.key() + "' (kit must be a list)");
            continue;
        }
        out.set(kv.key(), readStrings(kv.value()));
    }
    return true;
}

ContentBundle defaultContentBundle() { return ContentBundle{}; }

ContentBundle loadContentBundle(const std::string& dir) {
    namespace fs = std::filesystem;
    ContentBundle bundle = defaultContentBundle();
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        logWarn("Content directory " + dir + " not usable (" + (ec ? ec.message() : std::string("not found")) +
                "); using built-in content");
        return bundle;
    }
    const fs::path root(dir);
    (void)loadAllocationRules((root / "rules.json").string(), bundle.rules);
    (void)loadArchetypes((root / "archetypes.json").string(), bundle.archetypes);
    (void)loadSpecies((root / "species.json").string(), bundle.species);
    (void)loadSkillLinks((root / "skills.json").string(), bundle.skillLinks);
    (void)loadTalents((root / "talents.json").string(), bundle.talents);
    (void)loadEquipment((root / "equipment.json").string(), bundle.equipment);
    logInfo("Loaded NPC content from " + dir + " (" + std::to_string(bundle.archetypes.all().size()) +
            " archetypes, " + std::to_string(bundle.species.all().size()) + " species)");
    return bundle;
}

}  // namespace Forge::Content
