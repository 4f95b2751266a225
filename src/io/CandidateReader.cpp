#include "CandidateReader.hpp"
#include "../session/SessionSerializer.hpp"
#include "../utils/ErrorReporter.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace lexanon
{

bool CandidateReader::parseRecord(const json& record, Candidate& out, std::string& outReason)
{
    if (!record.is_object())
    {
        outReason = "record is not an object";
        return false;
    }

    out = Candidate{};
    out.text = record.value("text", std::string{});
    if (out.text.empty())
    {
        outReason = "missing 'text'";
        return false;
    }

    const std::string type_name = record.contains("type") ? record.value("type", std::string{})
                                                          : record.value("entity_type", std::string{});
    if (auto type = parseEntityType(type_name))
    {
        out.type = *type;
    }
    else
    {
        PLOG_WARNING << "Unknown entity type '" << type_name << "', mapped to other";
        out.type = EntityType::Other;
    }

    const std::string source_name = record.value("source", std::string{});
    auto source = parseEntitySource(source_name);
    if (!source)
    {
        outReason = "unknown source '" + source_name + "'";
        return false;
    }
    out.source = *source;

    out.id = record.value("id", std::string{});
    out.confidence = record.value("confidence", 1.0);
    out.start_offset = SessionSerializer::offsetFromJson(record, "start");
    out.end_offset = SessionSerializer::offsetFromJson(record, "end");
    if (record.contains("bbox") && !record["bbox"].is_null())
        out.bbox = SessionSerializer::bboxFromJson(record["bbox"]);
    return true;
}

bool CandidateReader::parse(const std::string& jsonContent, std::vector<Candidate>& outCandidates,
                            std::string& outError, Stats* outStats)
{
    Stats stats;
    try
    {
        const json doc = json::parse(jsonContent);
        const json* records = &doc;
        if (doc.is_object())
        {
            if (!doc.contains("entities") || !doc["entities"].is_array())
            {
                outError = "Candidate document has no 'entities' array";
                return false;
            }
            records = &doc["entities"];
        }
        else if (!doc.is_array())
        {
            outError = "Candidate document must be an array or an object";
            return false;
        }

        for (std::size_t i = 0; i < records->size(); ++i)
        {
            Candidate candidate;
            std::string reason;
            bool ok = false;
            try
            {
                ok = parseRecord((*records)[i], candidate, reason);
            }
            catch (const json::exception& e)
            {
                reason = e.what();
            }
            catch (const std::invalid_argument& e)
            {
                reason = e.what();
            }

            if (!ok)
            {
                ++stats.skipped;
                utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Input, "Skipped candidate record",
                                                    "record " + std::to_string(i) + ": " + reason);
                continue;
            }
            outCandidates.push_back(std::move(candidate));
            ++stats.read;
        }
    }
    catch (const json::exception& e)
    {
        outError = std::string("JSON parse error: ") + e.what();
        PLOG_ERROR << outError;
        return false;
    }

    if (outStats)
        *outStats = stats;
    PLOG_INFO << "Read " << stats.read << " candidates, skipped " << stats.skipped;
    return true;
}

bool CandidateReader::parseFile(const std::string& filePath, std::vector<Candidate>& outCandidates,
                                std::string& outError, Stats* outStats)
{
    std::ifstream file(filePath);
    if (!file.is_open())
    {
        outError = "Failed to open candidate file: " + filePath;
        PLOG_ERROR << outError;
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str(), outCandidates, outError, outStats);
}

} // namespace lexanon
