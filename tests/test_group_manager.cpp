#include <catch2/catch_test_macros.hpp>
#include "entity/EntityRegistry.hpp"
#include "entity/ReplacementPolicy.hpp"
#include "group/GroupManager.hpp"
#include "test_helpers.hpp"

using namespace lexanon;

namespace {

struct GroupFixture
{
    EntityRegistry registry;
    ReplacementPolicy policy;
    GroupManager groups{ registry, policy };

    EntityId jean = add("Jean Dupont", EntityType::Person);
    EntityId dupont = add("Dupont", EntityType::Person);
    EntityId acme = add("ACME", EntityType::Organization);

    EntityId add(const std::string& text, EntityType type)
    {
        return *registry.add(makeEntity(text, policy.defaultReplacement(type, text), type));
    }
};

} // namespace

TEST_CASE("GroupManager - Create", "[group]") {
    GroupFixture f;

    SECTION("Members take the group replacement and id") {
        auto gid = f.groups.createGroup("Dupont", "M. X", { f.jean, f.dupont });
        REQUIRE(gid.succeeded());
        REQUIRE(*gid == "grp_1");

        for (const auto& id : { f.jean, f.dupont }) {
            const Entity* e = f.registry.find(id);
            REQUIRE(e->replacement == "M. X");
            REQUIRE(e->group_id == *gid);
        }
        REQUIRE(f.groups.find(*gid)->member_ids.size() == 2);
        REQUIRE(f.registry.find(f.acme)->group_id == std::nullopt);
    }

    SECTION("Duplicate ids collapse") {
        auto gid = f.groups.createGroup("Dupont", "M. X", { f.jean, f.jean });
        REQUIRE(f.groups.find(*gid)->member_ids.size() == 1);
    }

    SECTION("Validation failures") {
        REQUIRE(f.groups.createGroup("Dupont", "M. X", {}).error->kind == ErrorKind::Validation);
        REQUIRE(f.groups.createGroup("Dupont", "M. X", { f.jean, "missing" }).error->kind ==
                ErrorKind::Validation);
        REQUIRE(f.groups.createGroup(" ", "M. X", { f.jean }).error->kind == ErrorKind::Validation);
        REQUIRE(f.groups.createGroup("Dupont", "", { f.jean }).error->kind == ErrorKind::Validation);
        REQUIRE(f.groups.size() == 0);
        REQUIRE_FALSE(f.registry.find(f.jean)->group_id.has_value());
    }

    SECTION("An entity belongs to one group at most") {
        REQUIRE(f.groups.createGroup("A", "M. X", { f.dupont }).succeeded());
        auto clash = f.groups.createGroup("B", "M. Y", { f.jean, f.dupont });
        REQUIRE(clash.error->kind == ErrorKind::Conflict);

        // Nothing of the failed call is visible
        REQUIRE_FALSE(f.registry.find(f.jean)->group_id.has_value());
        REQUIRE(f.registry.find(f.dupont)->replacement == "M. X");
        REQUIRE(f.groups.size() == 1);
    }
}

TEST_CASE("GroupManager - Replacement cascade", "[group]") {
    GroupFixture f;
    const GroupId gid = *f.groups.createGroup("Dupont", "M. X", { f.jean, f.dupont });

    REQUIRE(f.groups.updateGroupReplacement(gid, "M. Y").succeeded());
    REQUIRE(f.groups.find(gid)->replacement == "M. Y");
    REQUIRE(f.registry.find(f.jean)->replacement == "M. Y");
    REQUIRE(f.registry.find(f.dupont)->replacement == "M. Y");

    REQUIRE(f.groups.updateGroupReplacement("grp_99", "M. Z").error->kind == ErrorKind::NotFound);
    REQUIRE(f.groups.updateGroupReplacement(gid, "").error->kind == ErrorKind::Validation);
    REQUIRE(f.registry.find(f.jean)->replacement == "M. Y");

    SECTION("Members cannot diverge through the registry") {
        EntityPatch patch;
        patch.replacement = "Other";
        REQUIRE(f.registry.update(f.jean, patch).error->kind == ErrorKind::Conflict);
        REQUIRE(f.registry.find(f.jean)->replacement == "M. Y");
    }
}

TEST_CASE("GroupManager - Removal", "[group]") {
    GroupFixture f;
    const std::string jean_default = f.policy.defaultReplacement(EntityType::Person, "Jean Dupont");
    const std::string dupont_default = f.policy.defaultReplacement(EntityType::Person, "Dupont");

    const GroupId gid = *f.groups.createGroup("Dupont", "M. X", { f.jean, f.dupont });

    auto removed = f.groups.removeGroup(gid);
    REQUIRE(removed.succeeded());
    REQUIRE(*removed);
    REQUIRE(f.registry.find(f.jean)->replacement == jean_default);
    REQUIRE(f.registry.find(f.dupont)->replacement == dupont_default);
    REQUIRE_FALSE(f.registry.find(f.jean)->group_id.has_value());

    SECTION("Second removal is a no-op") {
        auto again = f.groups.removeGroup(gid);
        REQUIRE(again.succeeded());
        REQUIRE_FALSE(*again);
        REQUIRE(f.registry.find(f.jean)->replacement == jean_default);
    }

    SECTION("Recreate then remove regenerates identical defaults") {
        const GroupId again = *f.groups.createGroup("Dupont", "M. X", { f.jean, f.dupont });
        REQUIRE(again != gid);
        REQUIRE(*f.groups.removeGroup(again));
        REQUIRE(f.registry.find(f.jean)->replacement == jean_default);
        REQUIRE(f.registry.find(f.dupont)->replacement == dupont_default);
    }
}

TEST_CASE("GroupManager - Removing an unknown group", "[group]") {
    GroupFixture f;
    auto removed = f.groups.removeGroup("grp_404");
    REQUIRE(removed.succeeded());
    REQUIRE_FALSE(*removed);
    REQUIRE(f.groups.size() == 0);
}

TEST_CASE("GroupManager - Membership edits", "[group]") {
    GroupFixture f;
    const GroupId gid = *f.groups.createGroup("Dupont", "M. X", { f.jean });

    SECTION("addToGroup") {
        REQUIRE(f.groups.addToGroup(gid, f.dupont).succeeded());
        REQUIRE(f.registry.find(f.dupont)->replacement == "M. X");
        REQUIRE(f.groups.addToGroup(gid, f.dupont).succeeded());
        REQUIRE(f.groups.find(gid)->member_ids.size() == 2);

        REQUIRE(f.groups.addToGroup("grp_99", f.acme).error->kind == ErrorKind::NotFound);
        REQUIRE(f.groups.addToGroup(gid, "missing").error->kind == ErrorKind::NotFound);

        const GroupId other = *f.groups.createGroup("ACME", "SOCIETE", { f.acme });
        REQUIRE(f.groups.addToGroup(other, f.jean).error->kind == ErrorKind::Conflict);
    }

    SECTION("removeFromGroup restores the default and drops empty groups") {
        REQUIRE(f.groups.addToGroup(gid, f.dupont).succeeded());
        REQUIRE(f.groups.removeFromGroup(gid, f.dupont).succeeded());
        REQUIRE(f.registry.find(f.dupont)->replacement ==
                f.policy.defaultReplacement(EntityType::Person, "Dupont"));
        REQUIRE(f.groups.removeFromGroup(gid, f.dupont).error->kind == ErrorKind::NotFound);

        REQUIRE(f.groups.removeFromGroup(gid, f.jean).succeeded());
        REQUIRE(f.groups.find(gid) == nullptr);
    }

    SECTION("detachEntity") {
        f.groups.detachEntity(f.jean);
        REQUIRE(f.groups.find(gid) == nullptr);
    }
}

TEST_CASE("GroupManager - Grouping candidates", "[group]") {
    GroupFixture f;

    auto on = f.groups.toggleEntityForGroupingCandidate(f.jean);
    REQUIRE(on.succeeded());
    REQUIRE(*on == true);
    REQUIRE(*f.groups.toggleEntityForGroupingCandidate(f.dupont) == true);
    REQUIRE(*f.groups.toggleEntityForGroupingCandidate(f.dupont) == false);
    REQUIRE(f.groups.toggleEntityForGroupingCandidate("missing").error->kind == ErrorKind::NotFound);

    // Toggling never touches committed records
    REQUIRE_FALSE(f.registry.find(f.jean)->group_id.has_value());
    REQUIRE(f.groups.groupingCandidates() == std::vector<EntityId>{ f.jean });

    auto gid = f.groups.createGroupFromCandidates("Jean", "M. J");
    REQUIRE(gid.succeeded());
    REQUIRE(f.groups.groupingCandidates().empty());
    REQUIRE(f.registry.find(f.jean)->group_id == *gid);

    SECTION("Failure keeps the selection") {
        REQUIRE(*f.groups.toggleEntityForGroupingCandidate(f.jean) == true);
        REQUIRE_FALSE(f.groups.createGroupFromCandidates("Again", "M. K").succeeded());
        REQUIRE(f.groups.groupingCandidates().size() == 1);
        f.groups.clearGroupingCandidates();
        REQUIRE(f.groups.groupingCandidates().empty());
    }
}
