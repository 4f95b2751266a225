#include "EntityRegistry.hpp"
#include "../text/TextUtils.hpp"
#include "../utils/Diagnostics.hpp"

#include <plog/Log.h>

#include <cmath>

namespace lexanon
{

namespace
{

bool sameSpanAndSource(const Entity& a, const Entity& b)
{
    return a.source == b.source && a.hasSpan() && b.hasSpan() && *a.start_offset == *b.start_offset &&
           *a.end_offset == *b.end_offset;
}

} // namespace

Status EntityRegistry::validate(const Entity& entity)
{
    if (text::trim(entity.text).empty())
        return Status::failure(ErrorKind::Validation, "entity text is empty");

    if (entity.start_offset.has_value() != entity.end_offset.has_value())
        return Status::failure(ErrorKind::Validation, "start and end offsets must be given together");

    if (entity.hasSpan() && *entity.end_offset <= *entity.start_offset)
    {
        return Status::failure(ErrorKind::Validation, "end offset " + std::to_string(*entity.end_offset) +
                                                          " must be greater than start offset " +
                                                          std::to_string(*entity.start_offset));
    }

    if (entity.bbox && !entity.bbox->isValid())
        return Status::failure(ErrorKind::Validation, "bounding box has no area");

    if (std::isnan(entity.confidence) || entity.confidence < 0.0 || entity.confidence > 1.0)
        return Status::failure(ErrorKind::Validation, "confidence must be within [0, 1]");

    if (entity.selected && entity.replacement.empty())
        return Status::failure(ErrorKind::Validation, "a selected entity needs a replacement");

    return Status::success();
}

Status EntityRegistry::checkDuplicateSpan(const Entity& entity, const EntityId& ignore_id) const
{
    for (const auto& existing : entities_)
    {
        if (existing.id == ignore_id)
            continue;
        if (sameSpanAndSource(existing, entity))
        {
            return Status::failure(ErrorKind::Conflict, "entity " + existing.id + " already covers [" +
                                                            std::to_string(*entity.start_offset) + "," +
                                                            std::to_string(*entity.end_offset) + ") from source " +
                                                            toString(entity.source));
        }
    }
    return Status::success();
}

Status EntityRegistry::prepareInsert(Entity& entity, const std::unordered_map<EntityId, std::size_t>& pending) const
{
    if (entity.group_id)
        return Status::failure(ErrorKind::Validation, "group membership is assigned through the group manager");

    if (entity.source == EntitySource::Manual)
        entity.confidence = 1.0;

    if (auto st = validate(entity); !st)
        return st;

    if (!entity.id.empty() && (index_.count(entity.id) != 0 || pending.count(entity.id) != 0))
        return Status::failure(ErrorKind::Conflict, "entity id already in use: " + entity.id);

    return checkDuplicateSpan(entity, {});
}

EntityId EntityRegistry::generateId(const std::unordered_map<EntityId, std::size_t>& pending)
{
    EntityId id;
    do
    {
        id = "ent_" + std::to_string(next_id_++);
    } while (index_.count(id) != 0 || pending.count(id) != 0);
    return id;
}

Result<EntityId> EntityRegistry::add(Entity entity)
{
    if (auto st = prepareInsert(entity, {}); !st)
    {
        PLOG_DEBUG_(utils::Diagnostics::kLogInstance)
            << "[EntityRegistry] add rejected: " << toString(st.error->kind) << " " << st.error->message;
        Result<EntityId> res;
        res.error = st.error;
        return res;
    }

    if (entity.id.empty())
        entity.id = generateId({});

    const EntityId id = entity.id;
    index_[id] = entities_.size();
    entities_.push_back(std::move(entity));

    PLOG_DEBUG_(utils::Diagnostics::kLogInstance) << "[EntityRegistry] added " << id;
    return Result<EntityId>::success(id);
}

Result<std::vector<EntityId>> EntityRegistry::addMany(std::vector<Entity> entities)
{
    std::unordered_map<EntityId, std::size_t> pending;
    std::vector<Entity> staged;
    staged.reserve(entities.size());

    for (std::size_t i = 0; i < entities.size(); ++i)
    {
        Entity& entity = entities[i];
        if (auto st = prepareInsert(entity, pending); !st)
        {
            return Result<std::vector<EntityId>>::failure(st.error->kind,
                                                          "record " + std::to_string(i) + ": " + st.error->message);
        }
        for (const auto& other : staged)
        {
            if (sameSpanAndSource(other, entity))
            {
                return Result<std::vector<EntityId>>::failure(
                    ErrorKind::Conflict, "record " + std::to_string(i) + " duplicates the span of " + other.id);
            }
        }

        if (entity.id.empty())
            entity.id = generateId(pending);
        pending[entity.id] = staged.size();
        staged.push_back(std::move(entity));
    }

    std::vector<EntityId> ids;
    ids.reserve(staged.size());
    for (auto& entity : staged)
    {
        ids.push_back(entity.id);
        index_[entity.id] = entities_.size();
        entities_.push_back(std::move(entity));
    }

    PLOG_INFO_(utils::Diagnostics::kLogInstance) << "[EntityRegistry] bulk insert of " << ids.size() << " entities";
    return Result<std::vector<EntityId>>::success(std::move(ids));
}

Result<Entity> EntityRegistry::update(const EntityId& id, const EntityPatch& patch)
{
    auto it = index_.find(id);
    if (it == index_.end())
        return Result<Entity>::failure(ErrorKind::NotFound, "unknown entity: " + id);

    const Entity& current = entities_[it->second];
    Entity updated = current;

    if (patch.text)
        updated.text = *patch.text;
    if (patch.type)
        updated.type = *patch.type;
    if (patch.replacement)
        updated.replacement = *patch.replacement;
    if (patch.selected)
        updated.selected = *patch.selected;
    if (patch.confidence)
        updated.confidence = *patch.confidence;
    if (patch.clear_span)
    {
        updated.start_offset.reset();
        updated.end_offset.reset();
    }
    if (patch.start_offset)
        updated.start_offset = *patch.start_offset;
    if (patch.end_offset)
        updated.end_offset = *patch.end_offset;
    if (patch.occurrences)
        updated.occurrences = *patch.occurrences;

    if (updated.group_id && updated.replacement != current.replacement)
    {
        return Result<Entity>::failure(ErrorKind::Conflict,
                                       "entity " + id + " belongs to group " + *updated.group_id +
                                           "; change the group replacement instead");
    }

    if (updated.source == EntitySource::Manual)
        updated.confidence = 1.0;

    if (auto st = validate(updated); !st)
        return Result<Entity>::failure(st.error->kind, st.error->message);
    if (auto st = checkDuplicateSpan(updated, id); !st)
        return Result<Entity>::failure(st.error->kind, st.error->message);

    entities_[it->second] = updated;
    return Result<Entity>::success(std::move(updated));
}

Status EntityRegistry::remove(const EntityId& id)
{
    auto it = index_.find(id);
    if (it == index_.end())
        return Status::failure(ErrorKind::NotFound, "unknown entity: " + id);

    entities_.erase(entities_.begin() + static_cast<std::ptrdiff_t>(it->second));
    reindex();
    return Status::success();
}

Status EntityRegistry::removeMany(const std::vector<EntityId>& ids)
{
    for (const auto& id : ids)
    {
        if (index_.count(id) == 0)
            return Status::failure(ErrorKind::NotFound, "unknown entity: " + id);
    }

    std::unordered_map<EntityId, bool> doomed;
    for (const auto& id : ids)
        doomed[id] = true;

    std::erase_if(entities_, [&](const Entity& e) { return doomed.count(e.id) != 0; });
    reindex();
    return Status::success();
}

Status EntityRegistry::select(const EntityId& id, bool selected)
{
    EntityPatch patch;
    patch.selected = selected;
    auto res = update(id, patch);
    if (!res)
        return Status::propagate(res);
    return Status::success();
}

std::vector<Entity> EntityRegistry::list(const EntityFilter& filter) const
{
    std::vector<Entity> out;
    for (const auto& entity : entities_)
    {
        if (filter.matches(entity))
            out.push_back(entity);
    }
    return out;
}

const Entity* EntityRegistry::find(const EntityId& id) const
{
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : &entities_[it->second];
}

Status EntityRegistry::commit(const std::vector<Entity>& records)
{
    for (const auto& record : records)
    {
        if (index_.count(record.id) == 0)
            return Status::failure(ErrorKind::NotFound, "unknown entity: " + record.id);
        if (auto st = validate(record); !st)
            return Status::failure(st.error->kind, record.id + ": " + st.error->message);
    }

    for (const auto& record : records)
        entities_[index_.at(record.id)] = record;
    return Status::success();
}

void EntityRegistry::clear()
{
    entities_.clear();
    index_.clear();
}

void EntityRegistry::reindex()
{
    index_.clear();
    for (std::size_t i = 0; i < entities_.size(); ++i)
        index_[entities_[i].id] = i;
}

} // namespace lexanon
