#include "ExportBundle.hpp"
#include "../session/SessionSerializer.hpp"
#include "../text/TextUtils.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <filesystem>
#include <fstream>

using json = nlohmann::json;

namespace lexanon
{

namespace
{

bool writeFile(const std::string& path, const std::string& content, std::string& outError)
{
    try
    {
        const std::filesystem::path target(path);
        if (target.has_parent_path())
            std::filesystem::create_directories(target.parent_path());

        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            outError = "Failed to open output file: " + path;
            return false;
        }
        out << content;
        if (!out)
        {
            outError = "Failed to write output file: " + path;
            return false;
        }
        return true;
    }
    catch (const std::filesystem::filesystem_error& e)
    {
        outError = std::string("Filesystem error: ") + e.what();
        return false;
    }
}

} // namespace

std::string AuditRecord::method() const { return std::string(toString(source)) + "_validated_replacement"; }

std::size_t ExportBundle::totalReplacements() const
{
    std::size_t total = 0;
    for (const auto& record : audit)
        total += record.match_count;
    return total;
}

json ExportWriter::toJson(const ExportBundle& bundle)
{
    json audit_summary = json::array();
    for (const auto& record : bundle.audit)
    {
        // The original text is never written out, only its length
        audit_summary.push_back({ { "type", toString(record.type) },
                                  { "method", record.method() },
                                  { "original_length", text::codepointLength(record.original) },
                                  { "replacement", record.replacement },
                                  { "match_count", record.match_count },
                                  { "source", toString(record.source) },
                                  { "confidence", record.confidence },
                                  { "entity_ids", record.entity_ids } });
    }

    json entities = json::array();
    for (const auto& entity : bundle.entities)
        entities.push_back(SessionSerializer::entityToJson(entity));

    json groups = json::array();
    for (const auto& group : bundle.groups)
        groups.push_back(SessionSerializer::groupToJson(group));

    return json{ { "document", bundle.document_name },
                 { "generated_at", SessionSerializer::formatTimestamp(bundle.generated_at) },
                 { "anonymized_text", bundle.anonymized_text },
                 { "audit",
                   { { "entities_anonymized", bundle.entitiesAnonymized() },
                     { "total_replacements", bundle.totalReplacements() },
                     { "replacement_summary", std::move(audit_summary) } } },
                 { "entities", std::move(entities) },
                 { "groups", std::move(groups) } };
}

bool ExportWriter::writeBundle(const ExportBundle& bundle, const std::string& path, std::string& outError)
{
    if (!writeFile(path, toJson(bundle).dump(2), outError))
    {
        PLOG_ERROR << outError;
        return false;
    }
    PLOG_INFO << "Export bundle written to " << path;
    return true;
}

bool ExportWriter::writeText(const std::string& text, const std::string& path, std::string& outError)
{
    if (!writeFile(path, text, outError))
    {
        PLOG_ERROR << outError;
        return false;
    }
    PLOG_INFO << "Anonymized text written to " << path;
    return true;
}

} // namespace lexanon
