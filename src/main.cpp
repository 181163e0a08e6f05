#include <filesystem>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "../engine/core/Logger.h"
#include "../game/content/ContentBundle.h"
#include "../game/tools/ActorPayload.h"
#include "../game/tools/NpcGenerator.h"
#include "../game/tools/NpcReport.h"

namespace {

constexpr int kExitToolError = 1;
constexpr int kExitUsage = 2;

struct RunOptions {
    std::string command;
    std::string contentDir = "data/npc";
    std::string name;
    std::optional<int> xp;
    std::string archetype;
    std::string species = "human";
    std::vector<std::string> traits;
    std::optional<std::string> career;
    std::optional<std::string> description;
    bool payload = false;
    bool json = false;
    bool verbose = false;
};

bool parseInt(const std::string& s, int& out) {
    try {
        size_t pos = 0;
        const auto v = std::stoll(s, &pos);
        if (pos != s.size()) return false;
        if (v < static_cast<long long>(std::numeric_limits<int>::min()) ||
            v > static_cast<long long>(std::numeric_limits<int>::max())) {
            return false;
        }
        out = static_cast<int>(v);
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

void printUsage(const char* argv0) {
    const char* exe = argv0 ? argv0 : "npcforge";
    std::cerr << "Usage:\n"
              << "  " << exe << " create --name <n> --xp <int> --archetype <id> [--species <id>]\n"
              << "         [--trait <t>]... [--career <c>] [--description <d>] [--payload]\n"
              << "         [--content <dir>] [--verbose]\n"
              << "  " << exe << " archetypes [--content <dir>] [--verbose]\n"
              << "  " << exe << " preview --xp <int> --archetype <id> [--json] [--content <dir>] [--verbose]\n";
}

bool parseArgs(int argc, char** argv, RunOptions& opt) {
    if (argc < 2) return false;
    opt.command = argv[1];
    if (opt.command != "create" && opt.command != "archetypes" && opt.command != "preview") {
        std::cerr << "Unknown command: " << opt.command << "\n";
        return false;
    }

    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i] ? std::string(argv[i]) : std::string();
        auto requireValue = [&](std::string& out) -> bool {
            if (i + 1 >= argc) {
                std::cerr << arg << " requires a value\n";
                return false;
            }
            out = argv[++i] ? std::string(argv[i]) : std::string();
            return true;
        };

        std::string v;
        if (arg == "--help" || arg == "-h") {
            return false;
        } else if (arg == "--content") {
            if (!requireValue(opt.contentDir)) return false;
        } else if (arg == "--name") {
            if (!requireValue(opt.name)) return false;
        } else if (arg == "--xp") {
            int xp = 0;
            if (!requireValue(v)) return false;
            if (!parseInt(v, xp)) {
                std::cerr << "--xp expects an integer, got '" << v << "'\n";
                return false;
            }
            opt.xp = xp;
        } else if (arg == "--archetype") {
            if (!requireValue(opt.archetype)) return false;
        } else if (arg == "--species") {
            if (!requireValue(opt.species)) return false;
        } else if (arg == "--trait") {
            if (!requireValue(v)) return false;
            opt.traits.push_back(v);
        } else if (arg == "--career") {
            if (!requireValue(v)) return false;
            opt.career = v;
        } else if (arg == "--description") {
            if (!requireValue(v)) return false;
            opt.description = v;
        } else if (arg == "--payload") {
            opt.payload = true;
        } else if (arg == "--json") {
            opt.json = true;
        } else if (arg == "--verbose" || arg == "-v") {
            opt.verbose = true;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        }
    }

    if (opt.command == "create" && (opt.name.empty() || !opt.xp || opt.archetype.empty())) {
        std::cerr << "create requires --name, --xp and --archetype\n";
        return false;
    }
    if (opt.command == "preview" && (!opt.xp || opt.archetype.empty())) {
        std::cerr << "preview requires --xp and --archetype\n";
        return false;
    }
    return true;
}

int runCreate(const Forge::Content::ContentBundle& content, const RunOptions& opt) {
    Forge::Tools::NpcRequest request{};
    request.name = opt.name;
    request.totalXP = *opt.xp;
    request.archetypeId = opt.archetype;
    request.speciesId = opt.species;
    request.personalityTraits = opt.traits;
    request.career = opt.career;
    request.description = opt.description;

    const auto npc = Forge::Tools::generateNpc(content, request);
    std::cout << Forge::Tools::renderNpcReport(npc, content.talents) << "\n";
    if (opt.payload) {
        std::cout << "\n" << Forge::Tools::buildCreatePayload(npc, content.talents).dump(2) << "\n";
    }
    return 0;
}

int runPreview(const Forge::Content::ContentBundle& content, const RunOptions& opt) {
    const auto npc = Forge::Tools::previewDistribution(content, *opt.xp, opt.archetype);
    if (opt.json) {
        std::cout << Forge::Tools::allocationToJson(npc.allocation).dump(2) << "\n";
    } else {
        std::cout << Forge::Tools::renderDistributionPreview(npc) << "\n";
    }
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    RunOptions opt{};
    if (!parseArgs(argc, argv, opt)) {
        printUsage((argc > 0) ? argv[0] : nullptr);
        return kExitUsage;
    }
    if (opt.verbose) Forge::Logger::setMinLevel(Forge::LogLevel::Debug);

    try {
        const auto content = Forge::Content::loadContentBundle(opt.contentDir);
        if (opt.command == "create") return runCreate(content, opt);
        if (opt.command == "preview") return runPreview(content, opt);
        std::cout << Forge::Tools::renderArchetypeList(content.archetypes, content.rules) << "\n";
        return 0;
    } catch (const Forge::Tools::ToolError& e) {
        Forge::logError(e.what());
        return kExitToolError;
    } catch (const std::filesystem::filesystem_error& e) {
        Forge::logError(std::string("Content directory error: ") + e.what());
        return kExitToolError;
    }
}
