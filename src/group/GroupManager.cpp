#include "GroupManager.hpp"
#include "../entity/EntityRegistry.hpp"
#include "../entity/ReplacementPolicy.hpp"
#include "../text/TextUtils.hpp"
#include "../utils/Diagnostics.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <unordered_set>

namespace lexanon
{

GroupManager::GroupManager(EntityRegistry& registry, const ReplacementPolicy& policy)
    : registry_(registry)
    , policy_(policy)
{
}

GroupId GroupManager::generateId()
{
    GroupId id;
    do
    {
        id = "grp_" + std::to_string(next_id_++);
    } while (find(id) != nullptr);
    return id;
}

std::vector<EntityGroup>::iterator GroupManager::findIt(const GroupId& group_id)
{
    return std::find_if(groups_.begin(), groups_.end(), [&](const EntityGroup& g) { return g.id == group_id; });
}

const EntityGroup* GroupManager::find(const GroupId& group_id) const
{
    auto it = std::find_if(groups_.begin(), groups_.end(), [&](const EntityGroup& g) { return g.id == group_id; });
    return it == groups_.end() ? nullptr : &*it;
}

Result<GroupId> GroupManager::createGroup(const std::string& name, const std::string& replacement,
                                          const std::vector<EntityId>& entity_ids)
{
    if (text::trim(name).empty())
        return Result<GroupId>::failure(ErrorKind::Validation, "group name is empty");
    if (replacement.empty())
        return Result<GroupId>::failure(ErrorKind::Validation, "group replacement is empty");
    if (entity_ids.empty())
        return Result<GroupId>::failure(ErrorKind::Validation, "a group needs at least one entity");

    std::vector<EntityId> members;
    std::unordered_set<EntityId> seen;
    for (const auto& id : entity_ids)
    {
        if (seen.insert(id).second)
            members.push_back(id);
    }

    const GroupId group_id = generateId();
    std::vector<Entity> records;
    records.reserve(members.size());
    for (const auto& id : members)
    {
        const Entity* entity = registry_.find(id);
        if (!entity)
            return Result<GroupId>::failure(ErrorKind::Validation, "unknown entity: " + id);
        if (entity->group_id)
        {
            return Result<GroupId>::failure(ErrorKind::Conflict,
                                            "entity " + id + " already belongs to group " + *entity->group_id);
        }

        Entity record = *entity;
        record.group_id = group_id;
        record.replacement = replacement;
        records.push_back(std::move(record));
    }

    if (auto st = registry_.commit(records); !st)
        return Result<GroupId>::failure(st.error->kind, st.error->message);

    EntityGroup group;
    group.id = group_id;
    group.name = name;
    group.replacement = replacement;
    group.member_ids = std::move(members);
    groups_.push_back(std::move(group));

    PLOG_INFO_(utils::Diagnostics::kLogInstance)
        << "[GroupManager] created " << group_id << " with " << records.size() << " members";
    return Result<GroupId>::success(group_id);
}

Status GroupManager::updateGroupReplacement(const GroupId& group_id, const std::string& new_replacement)
{
    auto it = findIt(group_id);
    if (it == groups_.end())
        return Status::failure(ErrorKind::NotFound, "unknown group: " + group_id);
    if (new_replacement.empty())
        return Status::failure(ErrorKind::Validation, "group replacement is empty");

    std::vector<Entity> records;
    records.reserve(it->member_ids.size());
    for (const auto& id : it->member_ids)
    {
        const Entity* entity = registry_.find(id);
        if (!entity)
            return Status::failure(ErrorKind::NotFound, "group member vanished: " + id);
        Entity record = *entity;
        record.replacement = new_replacement;
        records.push_back(std::move(record));
    }

    if (auto st = registry_.commit(records); !st)
        return st;

    it->replacement = new_replacement;
    PLOG_DEBUG_(utils::Diagnostics::kLogInstance)
        << "[GroupManager] " << group_id << " replacement cascaded to " << records.size() << " members";
    return Status::success();
}

Result<bool> GroupManager::removeGroup(const GroupId& group_id)
{
    auto it = findIt(group_id);
    if (it == groups_.end())
        return Result<bool>::success(false);

    std::vector<Entity> records;
    for (const auto& id : it->member_ids)
    {
        const Entity* entity = registry_.find(id);
        if (!entity)
            continue;
        Entity record = *entity;
        record.group_id.reset();
        record.replacement = policy_.defaultReplacement(record.type, record.text);
        records.push_back(std::move(record));
    }

    if (auto st = registry_.commit(records); !st)
    {
        PLOG_ERROR_(utils::Diagnostics::kLogInstance)
            << "[GroupManager] failed to release members of " << group_id << ": " << st.error->message;
        return Result<bool>::failure(st.error->kind, st.error->message);
    }

    groups_.erase(it);
    PLOG_INFO_(utils::Diagnostics::kLogInstance)
        << "[GroupManager] removed " << group_id << ", " << records.size() << " members reset to defaults";
    return Result<bool>::success(true);
}

Status GroupManager::addToGroup(const GroupId& group_id, const EntityId& entity_id)
{
    auto it = findIt(group_id);
    if (it == groups_.end())
        return Status::failure(ErrorKind::NotFound, "unknown group: " + group_id);

    const Entity* entity = registry_.find(entity_id);
    if (!entity)
        return Status::failure(ErrorKind::NotFound, "unknown entity: " + entity_id);
    if (entity->group_id)
    {
        if (*entity->group_id == group_id)
            return Status::success();
        return Status::failure(ErrorKind::Conflict,
                               "entity " + entity_id + " already belongs to group " + *entity->group_id);
    }

    Entity record = *entity;
    record.group_id = group_id;
    record.replacement = it->replacement;
    if (auto st = registry_.commit({ record }); !st)
        return st;

    it->member_ids.push_back(entity_id);
    return Status::success();
}

Status GroupManager::removeFromGroup(const GroupId& group_id, const EntityId& entity_id)
{
    auto it = findIt(group_id);
    if (it == groups_.end())
        return Status::failure(ErrorKind::NotFound, "unknown group: " + group_id);

    const Entity* entity = registry_.find(entity_id);
    if (!entity)
        return Status::failure(ErrorKind::NotFound, "unknown entity: " + entity_id);
    if (!it->hasMember(entity_id))
        return Status::failure(ErrorKind::NotFound, "entity " + entity_id + " is not a member of " + group_id);

    Entity record = *entity;
    record.group_id.reset();
    record.replacement = policy_.defaultReplacement(record.type, record.text);
    if (auto st = registry_.commit({ record }); !st)
        return st;

    std::erase(it->member_ids, entity_id);
    if (it->member_ids.empty())
    {
        PLOG_DEBUG_(utils::Diagnostics::kLogInstance) << "[GroupManager] " << group_id << " emptied, removing";
        groups_.erase(it);
    }
    return Status::success();
}

void GroupManager::detachEntity(const EntityId& entity_id)
{
    std::erase(candidates_, entity_id);

    for (auto it = groups_.begin(); it != groups_.end(); ++it)
    {
        if (!it->hasMember(entity_id))
            continue;

        std::erase(it->member_ids, entity_id);
        if (it->member_ids.empty())
        {
            PLOG_DEBUG_(utils::Diagnostics::kLogInstance) << "[GroupManager] " << it->id << " emptied, removing";
            groups_.erase(it);
        }
        return;
    }
}

Result<bool> GroupManager::toggleEntityForGroupingCandidate(const EntityId& entity_id)
{
    if (!registry_.contains(entity_id))
        return Result<bool>::failure(ErrorKind::NotFound, "unknown entity: " + entity_id);

    auto it = std::find(candidates_.begin(), candidates_.end(), entity_id);
    if (it != candidates_.end())
    {
        candidates_.erase(it);
        return Result<bool>::success(false);
    }
    candidates_.push_back(entity_id);
    return Result<bool>::success(true);
}

Result<GroupId> GroupManager::createGroupFromCandidates(const std::string& name, const std::string& replacement)
{
    auto res = createGroup(name, replacement, candidates_);
    if (res)
        candidates_.clear();
    return res;
}

Status GroupManager::restore(std::vector<EntityGroup> groups)
{
    std::unordered_set<EntityId> claimed;
    for (const auto& group : groups)
    {
        if (group.member_ids.empty())
            return Status::failure(ErrorKind::Validation, "group " + group.id + " has no members");
        for (const auto& id : group.member_ids)
        {
            const Entity* entity = registry_.find(id);
            if (!entity)
                return Status::failure(ErrorKind::NotFound, "group " + group.id + " references unknown entity " + id);
            if (!claimed.insert(id).second)
                return Status::failure(ErrorKind::Conflict, "entity " + id + " is claimed by several groups");
            if (entity->group_id != group.id || entity->replacement != group.replacement)
            {
                return Status::failure(ErrorKind::Validation,
                                       "entity " + id + " is out of sync with group " + group.id);
            }
        }
    }

    groups_ = std::move(groups);
    candidates_.clear();
    for (const auto& group : groups_)
    {
        if (group.id.rfind("grp_", 0) != 0)
            continue;
        try
        {
            next_id_ = std::max(next_id_, static_cast<std::size_t>(std::stoull(group.id.substr(4))) + 1);
        }
        catch (const std::exception&)
        {
            // Non-numeric suffix: generateId() skips taken ids anyway
        }
    }
    return Status::success();
}

void GroupManager::clear()
{
    groups_.clear();
    candidates_.clear();
}

} // namespace lexanon
