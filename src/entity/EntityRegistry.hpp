#pragma once

#include "EngineResult.hpp"
#include "EntityTypes.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace lexanon
{

/// Canonical id -> entity store for one session.
///
/// Every mutation either applies completely or fails and leaves the previous
/// records untouched. Not thread-safe: callers serialize mutations per session.
class EntityRegistry
{
public:
    EntityRegistry() = default;

    /// Inserts one entity. Keeps a caller-supplied id when it is unused,
    /// otherwise generates `ent_<n>`.
    Result<EntityId> add(Entity entity);

    /// Bulk insert for one document; nothing is inserted if any record fails.
    Result<std::vector<EntityId>> addMany(std::vector<Entity> entities);

    Result<Entity> update(const EntityId& id, const EntityPatch& patch);

    Status remove(const EntityId& id);
    Status removeMany(const std::vector<EntityId>& ids);

    Status select(const EntityId& id, bool selected);

    /// Matching entities in insertion order
    std::vector<Entity> list(const EntityFilter& filter = {}) const;

    const Entity* find(const EntityId& id) const;
    bool contains(const EntityId& id) const { return index_.count(id) != 0; }
    const std::vector<Entity>& all() const { return entities_; }
    std::size_t size() const { return entities_.size(); }
    bool empty() const { return entities_.empty(); }

    /// Replaces several existing records at once (group membership changes).
    /// Fails without side effects if any id is unknown or any record is invalid.
    Status commit(const std::vector<Entity>& records);

    void clear();

    static Status validate(const Entity& entity);

private:
    Status checkDuplicateSpan(const Entity& entity, const EntityId& ignore_id) const;
    Status prepareInsert(Entity& entity, const std::unordered_map<EntityId, std::size_t>& pending) const;
    EntityId generateId(const std::unordered_map<EntityId, std::size_t>& pending);
    void reindex();

    std::vector<Entity> entities_;
    std::unordered_map<EntityId, std::size_t> index_;
    std::size_t next_id_ = 1;
};

} // namespace lexanon
