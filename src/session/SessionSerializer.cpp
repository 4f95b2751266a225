#include "SessionSerializer.hpp"
#include "../utils/Diagnostics.hpp"

#include <plog/Log.h>

#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace lexanon
{

namespace
{

EntityType requireType(const json& j)
{
    const std::string name = j.at("type").get<std::string>();
    auto type = parseEntityType(name);
    if (!type)
        throw std::invalid_argument("unknown entity type '" + name + "'");
    return *type;
}

EntitySource requireSource(const json& j)
{
    const std::string name = j.at("source").get<std::string>();
    auto source = parseEntitySource(name);
    if (!source)
        throw std::invalid_argument("unknown entity source '" + name + "'");
    return *source;
}

} // namespace

std::optional<std::size_t> SessionSerializer::offsetFromJson(const json& j, const std::string& key)
{
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return std::nullopt;
    // Negative integers would wrap around in get<std::size_t>()
    if (!it->is_number_unsigned())
        throw std::invalid_argument("offset '" + key + "' must be a non-negative integer");
    return it->get<std::size_t>();
}

json SessionSerializer::bboxToJson(const BoundingBox& box)
{
    return json{ { "page", box.page }, { "x0", box.x0 }, { "y0", box.y0 }, { "x1", box.x1 }, { "y1", box.y1 } };
}

BoundingBox SessionSerializer::bboxFromJson(const json& j)
{
    BoundingBox box;
    box.page = j.value("page", 0);
    box.x0 = j.at("x0").get<double>();
    box.y0 = j.at("y0").get<double>();
    box.x1 = j.at("x1").get<double>();
    box.y1 = j.at("y1").get<double>();
    return box;
}

json SessionSerializer::entityToJson(const Entity& entity)
{
    json j;
    j["id"] = entity.id;
    j["text"] = entity.text;
    j["type"] = toString(entity.type);
    j["source"] = toString(entity.source);
    j["start"] = entity.start_offset ? json(*entity.start_offset) : json(nullptr);
    j["end"] = entity.end_offset ? json(*entity.end_offset) : json(nullptr);
    j["bbox"] = entity.bbox ? bboxToJson(*entity.bbox) : json(nullptr);
    j["confidence"] = entity.confidence;
    j["occurrences"] = entity.occurrences;
    j["selected"] = entity.selected;
    j["replacement"] = entity.replacement;
    j["group_id"] = entity.group_id ? json(*entity.group_id) : json(nullptr);
    return j;
}

Entity SessionSerializer::entityFromJson(const json& j)
{
    Entity entity;
    entity.id = j.at("id").get<std::string>();
    entity.text = j.at("text").get<std::string>();
    entity.type = requireType(j);
    entity.source = requireSource(j);
    entity.start_offset = offsetFromJson(j, "start");
    entity.end_offset = offsetFromJson(j, "end");
    if (j.contains("bbox") && !j["bbox"].is_null())
        entity.bbox = bboxFromJson(j["bbox"]);
    entity.confidence = j.value("confidence", 1.0);
    entity.occurrences = j.value("occurrences", static_cast<std::size_t>(0));
    entity.selected = j.value("selected", false);
    entity.replacement = j.value("replacement", std::string{});
    if (j.contains("group_id") && !j["group_id"].is_null())
        entity.group_id = j["group_id"].get<std::string>();
    return entity;
}

json SessionSerializer::groupToJson(const EntityGroup& group)
{
    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(group.created_at.time_since_epoch()).count();
    return json{ { "id", group.id },
                 { "name", group.name },
                 { "replacement", group.replacement },
                 { "members", group.member_ids },
                 { "created_at", formatTimestamp(group.created_at) },
                 { "created_at_ms", ms } };
}

EntityGroup SessionSerializer::groupFromJson(const json& j)
{
    EntityGroup group;
    group.id = j.at("id").get<std::string>();
    group.name = j.at("name").get<std::string>();
    group.replacement = j.at("replacement").get<std::string>();
    group.member_ids = j.at("members").get<std::vector<EntityId>>();
    if (auto ms = j.find("created_at_ms"); ms != j.end() && ms->is_number_integer())
    {
        group.created_at = std::chrono::system_clock::time_point(std::chrono::milliseconds(ms->get<std::int64_t>()));
    }
    return group;
}

std::string SessionSerializer::formatTimestamp(std::chrono::system_clock::time_point tp)
{
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf{};
#ifdef _WIN32
    gmtime_s(&tm_buf, &t);
#else
    gmtime_r(&t, &tm_buf);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

json SessionSerializer::serialize(const Session& session)
{
    json j;
    j["document_name"] = session.documentName();
    j["document_text"] = session.documentText();

    json filters = json::object();
    for (const auto& [source, enabled] : session.sourceFilters())
        filters[toString(source)] = enabled;
    j["source_filters"] = std::move(filters);

    json entities = json::array();
    for (const auto& entity : session.registry().all())
        entities.push_back(entityToJson(entity));
    j["entities"] = std::move(entities);

    json groups = json::array();
    for (const auto& group : session.groups().groups())
        groups.push_back(groupToJson(group));
    j["groups"] = std::move(groups);

    return j;
}

std::unique_ptr<Session> SessionSerializer::deserialize(const json& j, SessionOptions options, std::string& outError)
{
    try
    {
        if (j.contains("source_filters") && j["source_filters"].is_object())
        {
            for (const auto& [name, value] : j["source_filters"].items())
            {
                auto source = parseEntitySource(name);
                if (!source)
                {
                    outError = "unknown source in filters: " + name;
                    return nullptr;
                }
                options.source_filters[*source] = value.get<bool>();
            }
        }

        auto session = std::make_unique<Session>(j.at("document_name").get<std::string>(),
                                                 j.at("document_text").get<std::string>(), std::move(options));

        std::vector<Entity> entities;
        if (j.contains("entities"))
        {
            for (const auto& item : j.at("entities"))
                entities.push_back(entityFromJson(item));
        }

        std::vector<EntityGroup> groups;
        if (j.contains("groups"))
        {
            for (const auto& item : j.at("groups"))
                groups.push_back(groupFromJson(item));
        }

        if (auto st = session->restore(std::move(entities), std::move(groups)); !st)
        {
            outError = std::string(toString(st.error->kind)) + ": " + st.error->message;
            return nullptr;
        }

        PLOG_INFO_(utils::Diagnostics::kLogInstance)
            << "[SessionSerializer] restored session with " << session->registry().size() << " entities and "
            << session->groups().size() << " groups";
        return session;
    }
    catch (const json::exception& e)
    {
        outError = std::string("JSON error: ") + e.what();
    }
    catch (const std::invalid_argument& e)
    {
        outError = e.what();
    }
    PLOG_ERROR_(utils::Diagnostics::kLogInstance) << "[SessionSerializer] " << outError;
    return nullptr;
}

} // namespace lexanon
