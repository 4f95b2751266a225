#include "SessionScript.hpp"
#include "../session/Session.hpp"
#include "../text/TextUtils.hpp"
#include "../utils/Diagnostics.hpp"
#include "../utils/ErrorReporter.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace lexanon
{

namespace
{

std::vector<EntityId> idsForText(const Session& session, const std::string& text)
{
    const std::string folded = text::foldCaseUtf8(text::trim(text));
    std::vector<EntityId> ids;
    for (const auto& entity : session.registry().all())
    {
        if (text::foldCaseUtf8(text::trim(entity.text)) == folded)
            ids.push_back(entity.id);
    }
    return ids;
}

} // namespace

bool SessionScript::parse(const std::string& jsonContent, SessionScript& outScript, std::string& outError)
{
    try
    {
        const json doc = json::parse(jsonContent);
        if (!doc.is_object())
        {
            outError = "Session script must be a JSON object";
            return false;
        }

        SessionScript script;
        if (doc.contains("manual"))
        {
            for (const auto& item : doc.at("manual"))
            {
                ManualEntity manual;
                manual.text = item.at("text").get<std::string>();
                const std::string type_name = item.value("type", std::string("other"));
                auto type = parseEntityType(type_name);
                if (!type)
                {
                    outError = "Unknown entity type in script: " + type_name;
                    return false;
                }
                manual.type = *type;
                manual.replacement = item.value("replacement", std::string{});
                script.manual.push_back(std::move(manual));
            }
        }

        if (doc.contains("filters"))
        {
            for (const auto& [name, enabled] : doc.at("filters").items())
            {
                auto source = parseEntitySource(name);
                if (!source)
                {
                    outError = "Unknown source in script filters: " + name;
                    return false;
                }
                script.filters[*source] = enabled.get<bool>();
            }
        }

        if (doc.contains("deselect"))
            script.deselect = doc.at("deselect").get<std::vector<std::string>>();

        if (doc.contains("groups"))
        {
            for (const auto& item : doc.at("groups"))
            {
                Group group;
                group.name = item.at("name").get<std::string>();
                group.replacement = item.at("replacement").get<std::string>();
                group.members = item.at("members").get<std::vector<std::string>>();
                script.groups.push_back(std::move(group));
            }
        }

        outScript = std::move(script);
        return true;
    }
    catch (const json::exception& e)
    {
        outError = std::string("JSON parse error: ") + e.what();
        PLOG_ERROR << outError;
        return false;
    }
}

bool SessionScript::parseFile(const std::string& filePath, SessionScript& outScript, std::string& outError)
{
    std::ifstream file(filePath);
    if (!file.is_open())
    {
        outError = "Failed to open session script: " + filePath;
        PLOG_ERROR << outError;
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str(), outScript, outError);
}

Status SessionScript::applyTo(Session& session) const
{
    for (const auto& item : manual)
    {
        auto res = session.addManualEntity(item.text, item.type, item.replacement);
        if (!res)
            return Status::propagate(res);
    }

    for (const auto& [source, enabled] : filters)
        session.setSourceFilter(source, enabled);

    for (const auto& text : deselect)
    {
        const auto ids = idsForText(session, text);
        if (ids.empty())
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Input, "Deselect matched no entity",
                                                utils::Diagnostics::Describe(text));
            continue;
        }
        for (const auto& id : ids)
        {
            if (auto st = session.selectEntity(id, false); !st)
                return st;
        }
    }

    for (const auto& group : groups)
    {
        std::vector<EntityId> members;
        for (const auto& ref : group.members)
        {
            if (session.registry().contains(ref))
            {
                members.push_back(ref);
                continue;
            }
            const auto ids = idsForText(session, ref);
            if (ids.empty())
            {
                return Status::failure(ErrorKind::Validation,
                                       "group '" + group.name + "' references an unknown entity");
            }
            members.insert(members.end(), ids.begin(), ids.end());
        }

        auto res = session.groups().createGroup(group.name, group.replacement, members);
        if (!res)
            return Status::propagate(res);
    }

    PLOG_INFO_(utils::Diagnostics::kLogInstance)
        << "[SessionScript] applied " << manual.size() << " manual entities, " << deselect.size()
        << " deselections, " << groups.size() << " groups";
    return Status::success();
}

} // namespace lexanon
