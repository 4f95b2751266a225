#include "Session.hpp"
#include "../text/LiteralMatcher.hpp"
#include "../text/TextUtils.hpp"
#include "../utils/Diagnostics.hpp"

#include <plog/Log.h>

namespace lexanon
{

namespace
{

Candidate toCandidate(const Entity& entity)
{
    Candidate c;
    c.id = entity.id;
    c.text = entity.text;
    c.type = entity.type;
    c.source = entity.source;
    c.confidence = entity.confidence;
    c.start_offset = entity.start_offset;
    c.end_offset = entity.end_offset;
    c.bbox = entity.bbox;
    return c;
}

const Entity* findSameSpan(const EntityRegistry& registry, const Entity& entity)
{
    if (!entity.hasSpan())
        return nullptr;
    for (const auto& existing : registry.all())
    {
        if (existing.source == entity.source && existing.start_offset == entity.start_offset &&
            existing.end_offset == entity.end_offset)
            return &existing;
    }
    return nullptr;
}

} // namespace

Session::Session(std::string document_name, std::string document_text, SessionOptions options)
    : document_name_(std::move(document_name))
    , document_text_(std::move(document_text))
    , policy_(std::move(options.policy))
    , resolver_options_(options.resolver)
    , substitution_options_(options.substitution)
    , source_filters_(std::move(options.source_filters))
    , groups_(registry_, policy_)
{
}

std::size_t Session::countOccurrences(const std::string& text) const
{
    return text::FoldedText(document_text_).count(text);
}

Result<ResolveReport> Session::ingest(const std::vector<Candidate>& candidates)
{
    const OverlapResolver resolver(resolver_options_);
    ResolveReport report = resolver.resolve(candidates, document_text_);

    std::vector<Entity> staged;
    staged.reserve(report.accepted.size());
    for (auto& entity : report.accepted)
    {
        if (const Entity* existing = findSameSpan(registry_, entity))
        {
            report.rejected.push_back({ toCandidate(entity), "duplicate-of: " + existing->id });
            continue;
        }
        if (registry_.contains(entity.id))
            entity.id.clear();

        entity.replacement = policy_.defaultReplacement(entity.type, entity.text);
        entity.selected = policy_.defaultSelected(entity.type);
        staged.push_back(std::move(entity));
    }

    auto ids = registry_.addMany(staged);
    if (!ids)
        return Result<ResolveReport>::propagate(ids);

    for (std::size_t i = 0; i < staged.size(); ++i)
        staged[i] = *registry_.find((*ids)[i]);
    report.accepted = std::move(staged);

    PLOG_INFO_(utils::Diagnostics::kLogInstance) << "[Session] " << document_name_ << ": ingested "
                                                 << report.accepted.size() << " entities";
    return Result<ResolveReport>::success(std::move(report));
}

Result<EntityId> Session::addManualEntity(const std::string& text, EntityType type, const std::string& replacement)
{
    const std::string trimmed = text::trim(text);
    if (trimmed.empty())
        return Result<EntityId>::failure(ErrorKind::Validation, "entity text is empty");

    const std::string folded = text::foldCaseUtf8(trimmed);
    for (const auto& existing : registry_.all())
    {
        if (text::foldCaseUtf8(text::trim(existing.text)) == folded)
            return Result<EntityId>::failure(ErrorKind::Conflict, "text already tracked by entity " + existing.id);
    }

    const text::FoldedText document(document_text_);

    Entity entity;
    entity.text = trimmed;
    entity.type = type;
    entity.source = EntitySource::Manual;
    entity.confidence = 1.0;
    if (auto pos = document.findFirst(trimmed))
    {
        entity.start_offset = *pos;
        entity.end_offset = *pos + text::codepointLength(trimmed);
    }
    entity.occurrences = document.count(trimmed);
    entity.replacement = replacement.empty() ? policy_.defaultReplacement(type, trimmed) : replacement;
    entity.selected = true;

    auto res = registry_.add(std::move(entity));
    if (res)
    {
        PLOG_INFO_(utils::Diagnostics::kLogInstance)
            << "[Session] manual entity " << *res << " (" << toString(type) << ", "
            << utils::Diagnostics::Describe(trimmed) << ")";
    }
    return res;
}

Result<Entity> Session::modifyEntity(const EntityId& id, const std::string& new_text,
                                     const std::optional<std::string>& new_replacement)
{
    const Entity* current = registry_.find(id);
    if (!current)
        return Result<Entity>::failure(ErrorKind::NotFound, "unknown entity: " + id);

    const std::string trimmed = text::trim(new_text);
    if (trimmed.empty())
        return Result<Entity>::failure(ErrorKind::Validation, "entity text is empty");

    EntityPatch patch;
    patch.text = trimmed;
    patch.replacement = new_replacement;

    if (trimmed != current->text)
    {
        const text::FoldedText document(document_text_);
        if (auto pos = document.findFirst(trimmed))
        {
            patch.start_offset = *pos;
            patch.end_offset = *pos + text::codepointLength(trimmed);
        }
        else
        {
            patch.clear_span = true;
        }
        patch.occurrences = document.count(trimmed);
    }
    else
    {
        patch.occurrences = countOccurrences(trimmed);
    }

    return registry_.update(id, patch);
}

Status Session::removeEntity(const EntityId& id)
{
    if (!registry_.contains(id))
        return Status::failure(ErrorKind::NotFound, "unknown entity: " + id);

    groups_.detachEntity(id);
    return registry_.remove(id);
}

Status Session::selectEntity(const EntityId& id, bool selected) { return registry_.select(id, selected); }

void Session::setSourceFilter(EntitySource source, bool enabled)
{
    source_filters_[source] = enabled;
    PLOG_DEBUG_(utils::Diagnostics::kLogInstance)
        << "[Session] source " << toString(source) << (enabled ? " enabled" : " disabled");
}

bool Session::sourceEnabled(EntitySource source) const
{
    auto it = source_filters_.find(source);
    return it == source_filters_.end() || it->second;
}

bool Session::isEligible(const Entity& entity) const { return sourceEnabled(entity.source); }

std::vector<Entity> Session::selectedEntities() const
{
    std::vector<Entity> out;
    for (const auto& entity : registry_.all())
    {
        if (entity.selected && isEligible(entity))
            out.push_back(entity);
    }
    return out;
}

EntityStats Session::stats() const
{
    EntityStats s;
    s.total = registry_.size();
    for (const auto& entity : registry_.all())
    {
        ++s.by_type[entity.type];
        if (entity.selected && isEligible(entity))
            ++s.selected_count;
    }
    return s;
}

ExportBundle Session::anonymize() const
{
    const SubstitutionEngine engine(substitution_options_);
    SubstitutionResult result = engine.apply(document_text_, selectedEntities());

    ExportBundle bundle;
    bundle.document_name = document_name_;
    bundle.anonymized_text = std::move(result.anonymized_text);
    bundle.entities = registry_.all();
    bundle.groups = groups_.groups();

    for (auto& entry : result.audit)
    {
        AuditRecord record;
        record.original = std::move(entry.original);
        record.replacement = std::move(entry.replacement);
        record.match_count = entry.match_count;
        record.entity_ids = std::move(entry.entity_ids);

        // Describe the record by the entity whose replacement was applied
        const Entity* owner = nullptr;
        for (const auto& id : record.entity_ids)
        {
            const Entity* entity = registry_.find(id);
            if (entity && (!owner || entity->replacement == record.replacement))
            {
                owner = entity;
                if (entity->replacement == record.replacement)
                    break;
            }
        }
        if (owner)
        {
            record.type = owner->type;
            record.source = owner->source;
            record.confidence = owner->confidence;
        }
        bundle.audit.push_back(std::move(record));
    }

    PLOG_INFO_(utils::Diagnostics::kLogInstance)
        << "[Session] " << document_name_ << ": anonymized with " << bundle.entitiesAnonymized() << " substitutions, "
        << bundle.totalReplacements() << " replacements";
    return bundle;
}

Status Session::restore(std::vector<Entity> entities, std::vector<EntityGroup> groups)
{
    if (!registry_.empty() || groups_.size() != 0)
        return Status::failure(ErrorKind::Conflict, "session already holds entities");

    // Membership is owned by the group manager; insert plain records first
    std::vector<Entity> grouped;
    for (auto& entity : entities)
    {
        if (entity.group_id)
        {
            grouped.push_back(entity);
            entity.group_id.reset();
        }
    }

    auto ids = registry_.addMany(std::move(entities));
    if (!ids)
        return Status::propagate(ids);

    Status st = registry_.commit(grouped);
    if (st)
        st = groups_.restore(std::move(groups));
    if (!st)
    {
        registry_.clear();
        groups_.clear();
    }
    return st;
}

} // namespace lexanon
