#pragma once

#include "../entity/EntityTypes.hpp"

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace lexanon
{

// One applied substitution as it appears in the audit log.
struct AuditRecord
{
    std::string original; // Kept in memory only; the JSON form carries its length
    std::string replacement;
    std::size_t match_count = 0;
    EntityType type = EntityType::Other;
    EntitySource source = EntitySource::Manual;
    double confidence = 1.0;
    std::vector<EntityId> entity_ids;

    std::string method() const;
};

// What the export coordinator receives: anonymized text, audit trail and the
// final entity/group state the text was produced from.
struct ExportBundle
{
    std::string document_name;
    std::string anonymized_text;
    std::vector<AuditRecord> audit;
    std::vector<Entity> entities;
    std::vector<EntityGroup> groups;
    std::chrono::system_clock::time_point generated_at = std::chrono::system_clock::now();

    std::size_t entitiesAnonymized() const { return audit.size(); }
    std::size_t totalReplacements() const;
};

class ExportWriter
{
public:
    static nlohmann::json toJson(const ExportBundle& bundle);

    static bool writeBundle(const ExportBundle& bundle, const std::string& path, std::string& outError);
    static bool writeText(const std::string& text, const std::string& path, std::string& outError);
};

} // namespace lexanon
