#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace lexanon
{

using EntityId = std::string;
using GroupId = std::string;

enum class EntityType
{
    Person,
    Organization,
    Phone,
    Email,
    NationalId,
    RegistryNumber,
    Address,
    LegalReference,
    Other
};

enum class EntitySource
{
    Pattern, // Deterministic pattern extractor
    Model,   // Statistical named-entity recognizer
    Manual   // Added by the user
};

inline constexpr std::array<EntityType, 9> kAllEntityTypes = {
    EntityType::Person,        EntityType::Organization, EntityType::Phone,
    EntityType::Email,         EntityType::NationalId,   EntityType::RegistryNumber,
    EntityType::Address,       EntityType::LegalReference, EntityType::Other
};

inline constexpr std::array<EntitySource, 3> kAllEntitySources = {
    EntitySource::Pattern, EntitySource::Model, EntitySource::Manual
};

const char* toString(EntityType type);
const char* toString(EntitySource source);

/// Accepts canonical names ("national-id") and the legacy upper-case labels
/// ("SECU_SOCIALE"), case-insensitively.
std::optional<EntityType> parseEntityType(const std::string& name);

/// Accepts "pattern"/"model"/"manual" and the legacy "regex"/"ner".
std::optional<EntitySource> parseEntitySource(const std::string& name);

/// Tie-break rank used by the overlap resolver: pattern > manual > model.
int sourcePriority(EntitySource source);

/// Page-space rectangle for detections that only exist spatially (OCR, PDF).
struct BoundingBox
{
    int page = 0;
    double x0 = 0.0;
    double y0 = 0.0;
    double x1 = 0.0;
    double y1 = 0.0;

    double area() const;
    bool isValid() const;
    bool overlaps(const BoundingBox& other) const;
};

struct Entity
{
    EntityId id;
    std::string text;
    EntityType type = EntityType::Other;
    EntitySource source = EntitySource::Manual;
    std::optional<std::size_t> start_offset; // Code-point index, inclusive
    std::optional<std::size_t> end_offset;   // Code-point index, exclusive
    std::optional<BoundingBox> bbox;
    double confidence = 1.0;
    std::size_t occurrences = 0;
    bool selected = false;
    std::string replacement;
    std::optional<GroupId> group_id;

    bool hasSpan() const { return start_offset.has_value() && end_offset.has_value(); }
};

// Raw detection as delivered by an extraction adapter.
struct Candidate
{
    std::string id; // Optional; the resolver assigns one when empty
    std::string text;
    EntityType type = EntityType::Other;
    EntitySource source = EntitySource::Pattern;
    double confidence = 1.0;
    std::optional<std::size_t> start_offset;
    std::optional<std::size_t> end_offset;
    std::optional<BoundingBox> bbox;
};

struct EntityGroup
{
    GroupId id;
    std::string name;
    std::string replacement;
    std::vector<EntityId> member_ids; // Insertion order, no duplicates
    std::chrono::system_clock::time_point created_at = std::chrono::system_clock::now();

    bool hasMember(const EntityId& entity_id) const;
};

// Partial edit applied by EntityRegistry::update. Unset fields are left alone.
struct EntityPatch
{
    std::optional<std::string> text;
    std::optional<EntityType> type;
    std::optional<std::string> replacement;
    std::optional<bool> selected;
    std::optional<double> confidence;
    std::optional<std::size_t> start_offset;
    std::optional<std::size_t> end_offset;
    std::optional<std::size_t> occurrences;
    bool clear_span = false; // Drop both offsets before applying start/end
};

struct EntityFilter
{
    std::optional<EntityType> type;
    std::optional<EntitySource> source;
    std::optional<double> min_confidence;

    bool matches(const Entity& entity) const;
};

} // namespace lexanon
