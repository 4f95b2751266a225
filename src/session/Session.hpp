#pragma once

#include "../entity/EngineResult.hpp"
#include "../entity/EntityRegistry.hpp"
#include "../entity/EntityTypes.hpp"
#include "../entity/ReplacementPolicy.hpp"
#include "../export/ExportBundle.hpp"
#include "../group/GroupManager.hpp"
#include "../resolve/OverlapResolver.hpp"
#include "../substitution/SubstitutionEngine.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace lexanon
{

struct SessionOptions
{
    ReplacementPolicy policy;
    ResolverOptions resolver;
    SubstitutionOptions substitution;
    std::map<EntitySource, bool> source_filters = {
        { EntitySource::Pattern, true },
        { EntitySource::Model, true },
        { EntitySource::Manual, true },
    };
};

struct EntityStats
{
    std::size_t total = 0;
    std::map<EntityType, std::size_t> by_type;
    std::size_t selected_count = 0;
};

/// Review state for one document: the entity registry, its groups and the
/// per-source eligibility filter, plus the operations that keep them in sync.
///
/// Owns everything it references; not copyable or movable since the group
/// manager keeps references into it. One session per document, mutated from
/// one thread at a time.
class Session
{
public:
    Session(std::string document_name, std::string document_text, SessionOptions options = {});

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const std::string& documentName() const { return document_name_; }
    const std::string& documentText() const { return document_text_; }

    /// Resolves overlapping detections, applies default replacements and
    /// selection, and inserts the accepted set in one step. Accepted
    /// entities that repeat a span already in the session are rejected.
    Result<ResolveReport> ingest(const std::vector<Candidate>& candidates);

    /// Adds a user-entered entity. An empty replacement means "use the type
    /// default". Fails with Conflict when the same text is already tracked.
    Result<EntityId> addManualEntity(const std::string& text, EntityType type,
                                     const std::string& replacement = {});

    Result<Entity> modifyEntity(const EntityId& id, const std::string& new_text,
                                const std::optional<std::string>& new_replacement = std::nullopt);

    Status removeEntity(const EntityId& id);
    Status selectEntity(const EntityId& id, bool selected);

    void setSourceFilter(EntitySource source, bool enabled);
    bool sourceEnabled(EntitySource source) const;
    const std::map<EntitySource, bool>& sourceFilters() const { return source_filters_; }

    bool isEligible(const Entity& entity) const;
    std::vector<Entity> selectedEntities() const;
    EntityStats stats() const;

    ExportBundle anonymize() const;

    /// Reloads previously serialized entities and groups into an empty session.
    Status restore(std::vector<Entity> entities, std::vector<EntityGroup> groups);

    EntityRegistry& registry() { return registry_; }
    const EntityRegistry& registry() const { return registry_; }
    GroupManager& groups() { return groups_; }
    const GroupManager& groups() const { return groups_; }
    const ReplacementPolicy& policy() const { return policy_; }
    const ResolverOptions& resolverOptions() const { return resolver_options_; }
    const SubstitutionOptions& substitutionOptions() const { return substitution_options_; }

private:
    std::size_t countOccurrences(const std::string& text) const;

    std::string document_name_;
    std::string document_text_;
    ReplacementPolicy policy_;
    ResolverOptions resolver_options_;
    SubstitutionOptions substitution_options_;
    std::map<EntitySource, bool> source_filters_;
    EntityRegistry registry_;
    GroupManager groups_;
};

} // namespace lexanon
