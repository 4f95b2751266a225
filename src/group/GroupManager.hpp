#pragma once

#include "../entity/EngineResult.hpp"
#include "../entity/EntityTypes.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace lexanon
{

class EntityRegistry;
class ReplacementPolicy;

/// Clusters registry entities under one shared replacement.
///
/// An entity belongs to at most one group, every member carries the group's
/// replacement and id, and a group always has at least one member. Member
/// records are written back to the registry in one commit, so a failed call
/// leaves both groups and entities as they were.
class GroupManager
{
public:
    GroupManager(EntityRegistry& registry, const ReplacementPolicy& policy);

    Result<GroupId> createGroup(const std::string& name, const std::string& replacement,
                                const std::vector<EntityId>& entity_ids);

    Status updateGroupReplacement(const GroupId& group_id, const std::string& new_replacement);

    /// Clears membership and regenerates each member's default replacement.
    /// Succeeds with false when the group did not exist (idempotent); fails
    /// only when the member records cannot be written back.
    Result<bool> removeGroup(const GroupId& group_id);

    Status addToGroup(const GroupId& group_id, const EntityId& entity_id);

    /// Takes one member out of its group and gives it back its default
    /// replacement. Removing the last member removes the group.
    Status removeFromGroup(const GroupId& group_id, const EntityId& entity_id);

    /// Drops an entity from its group without touching the registry record;
    /// used right before the entity itself is deleted. Empty groups are removed.
    void detachEntity(const EntityId& entity_id);

    /// Toggles an id in the pending grouping selection. No registry change.
    /// Returns the new membership state of the id in the selection.
    Result<bool> toggleEntityForGroupingCandidate(const EntityId& entity_id);
    const std::vector<EntityId>& groupingCandidates() const { return candidates_; }
    void clearGroupingCandidates() { candidates_.clear(); }

    /// createGroup over the pending selection; clears it on success.
    Result<GroupId> createGroupFromCandidates(const std::string& name, const std::string& replacement);

    const EntityGroup* find(const GroupId& group_id) const;
    const std::vector<EntityGroup>& groups() const { return groups_; }
    std::size_t size() const { return groups_.size(); }

    /// Restores previously serialized groups. Membership must already be
    /// reflected in the registry records.
    Status restore(std::vector<EntityGroup> groups);

    void clear();

private:
    GroupId generateId();
    std::vector<EntityGroup>::iterator findIt(const GroupId& group_id);

    EntityRegistry& registry_;
    const ReplacementPolicy& policy_;
    std::vector<EntityGroup> groups_;
    std::vector<EntityId> candidates_;
    std::size_t next_id_ = 1;
};

} // namespace lexanon
