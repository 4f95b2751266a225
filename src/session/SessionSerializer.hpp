#pragma once

#include "../entity/EntityTypes.hpp"
#include "Session.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace lexanon
{

// JSON conversion of session state, used to keep a review session alive
// across calls and by the export bundle.
class SessionSerializer
{
public:
    static nlohmann::json serialize(const Session& session);

    /// Builds a new session from serialize() output. Returns nullptr and
    /// fills outError when the document is malformed or inconsistent.
    static std::unique_ptr<Session> deserialize(const nlohmann::json& j, SessionOptions options,
                                                std::string& outError);

    static nlohmann::json entityToJson(const Entity& entity);
    static nlohmann::json groupToJson(const EntityGroup& group);

    // Both throw nlohmann::json::exception or std::invalid_argument on bad input
    static Entity entityFromJson(const nlohmann::json& j);
    static EntityGroup groupFromJson(const nlohmann::json& j);

    /// Optional code-point offset stored under `key`. Null or missing gives
    /// nullopt; anything but a non-negative integer throws std::invalid_argument.
    static std::optional<std::size_t> offsetFromJson(const nlohmann::json& j, const std::string& key);

    static nlohmann::json bboxToJson(const BoundingBox& box);
    static BoundingBox bboxFromJson(const nlohmann::json& j);

    /// UTC, ISO-8601 with a trailing 'Z'
    static std::string formatTimestamp(std::chrono::system_clock::time_point tp);
};

} // namespace lexanon
