#pragma once

#include "../entity/EngineResult.hpp"
#include "../entity/EntityTypes.hpp"

#include <map>
#include <string>
#include <vector>

namespace lexanon
{

class Session;

/// Scripted review decisions for non-interactive runs: manual entities,
/// source filters, deselections and groups, applied in that order.
struct SessionScript
{
    struct ManualEntity
    {
        std::string text;
        EntityType type = EntityType::Other;
        std::string replacement; // Empty: type default
    };

    struct Group
    {
        std::string name;
        std::string replacement;
        std::vector<std::string> members; // Entity ids or entity texts
    };

    std::vector<ManualEntity> manual;
    std::map<EntitySource, bool> filters;
    std::vector<std::string> deselect; // Entity texts, matched case-insensitively
    std::vector<Group> groups;

    static bool parse(const std::string& jsonContent, SessionScript& outScript, std::string& outError);
    static bool parseFile(const std::string& filePath, SessionScript& outScript, std::string& outError);

    /// Stops at the first failing step; earlier steps stay applied.
    Status applyTo(Session& session) const;
};

} // namespace lexanon
