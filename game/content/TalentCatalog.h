// One-line rules summaries for talents shown in NPC reports and talent payloads.
#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>

namespace Forge::Content {

class TalentCatalog {
public:
    TalentCatalog();
    explicit TalentCatalog(std::unordered_map<std::string, std::string> descriptions);

    // "Special ability" for talents without an entry.
    const std::string& describe(const std::string& talent) const;
    bool contains(const std::string& talent) const;
    std::size_t size() const { return descriptions_.size(); }

    void set(const std::string& talent, std::string description);

private:
    std::unordered_map<std::string, std::string> descriptions_;
};

std::unordered_map<std::string, std::string> defaultTalentDescriptions();

}  // namespace Forge::Content
