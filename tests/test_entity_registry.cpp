#include <catch2/catch_test_macros.hpp>
#include "entity/EntityRegistry.hpp"
#include "test_helpers.hpp"

#include <limits>

using namespace lexanon;

namespace {

Entity spanEntity(const std::string& text, std::size_t start, std::size_t end,
                  EntitySource source = EntitySource::Pattern)
{
    Entity e = makeEntity(text, "X", EntityType::Person, source);
    e.start_offset = start;
    e.end_offset = end;
    e.confidence = 0.9;
    return e;
}

} // namespace

TEST_CASE("EntityRegistry - Add and validation", "[registry]") {
    EntityRegistry registry;

    SECTION("Generates ids and keeps supplied ones") {
        auto first = registry.add(makeEntity("Jean Dupont", "M. X"));
        REQUIRE(first.succeeded());
        REQUIRE(*first == "ent_1");

        Entity named = makeEntity("ACME", "ORG");
        named.id = "acme";
        auto second = registry.add(named);
        REQUIRE(second.succeeded());
        REQUIRE(*second == "acme");
        REQUIRE(registry.size() == 2);
        REQUIRE(registry.contains("acme"));
    }

    SECTION("Rejects malformed entities") {
        REQUIRE(registry.add(makeEntity("", "X")).error->kind == ErrorKind::Validation);
        REQUIRE(registry.add(makeEntity("   ", "X")).error->kind == ErrorKind::Validation);

        Entity half = makeEntity("Jean", "X");
        half.start_offset = 3;
        REQUIRE(registry.add(half).error->kind == ErrorKind::Validation);

        REQUIRE(registry.add(spanEntity("Jean", 5, 5)).error->kind == ErrorKind::Validation);
        REQUIRE(registry.add(spanEntity("Jean", 6, 2)).error->kind == ErrorKind::Validation);

        Entity confident = makeEntity("Jean", "X", EntityType::Person, EntitySource::Model);
        confident.confidence = 1.5;
        REQUIRE(registry.add(confident).error->kind == ErrorKind::Validation);
        confident.confidence = std::numeric_limits<double>::quiet_NaN();
        REQUIRE(registry.add(confident).error->kind == ErrorKind::Validation);

        Entity unnamed = makeEntity("Jean", "");
        unnamed.selected = true;
        REQUIRE(registry.add(unnamed).error->kind == ErrorKind::Validation);

        Entity grouped = makeEntity("Jean", "X");
        grouped.group_id = "grp_1";
        REQUIRE(registry.add(grouped).error->kind == ErrorKind::Validation);

        REQUIRE(registry.empty());
    }

    SECTION("Conflicts on reused id and on same span and source") {
        Entity a = makeEntity("Jean", "X");
        a.id = "dup";
        REQUIRE(registry.add(a).succeeded());
        REQUIRE(registry.add(a).error->kind == ErrorKind::Conflict);

        REQUIRE(registry.add(spanEntity("Dupont", 5, 11)).succeeded());
        REQUIRE(registry.add(spanEntity("Dupont", 5, 11)).error->kind == ErrorKind::Conflict);
        REQUIRE(registry.add(spanEntity("Dupont", 5, 11, EntitySource::Model)).succeeded());
    }

    SECTION("Manual entities carry confidence 1.0") {
        Entity manual = makeEntity("Jean", "X");
        manual.confidence = 0.2;
        auto id = registry.add(manual);
        REQUIRE(id.succeeded());
        REQUIRE(registry.find(*id)->confidence == 1.0);
    }
}

TEST_CASE("EntityRegistry - Bulk insert is all-or-nothing", "[registry]") {
    EntityRegistry registry;

    std::vector<Entity> batch{ spanEntity("Jean", 0, 4), makeEntity("", "X"), spanEntity("Paul", 10, 14) };
    auto res = registry.addMany(batch);
    REQUIRE_FALSE(res.succeeded());
    REQUIRE(res.error->kind == ErrorKind::Validation);
    REQUIRE(registry.empty());

    std::vector<Entity> twins{ spanEntity("Jean", 0, 4), spanEntity("Jean", 0, 4) };
    REQUIRE(registry.addMany(twins).error->kind == ErrorKind::Conflict);
    REQUIRE(registry.empty());

    std::vector<Entity> good{ spanEntity("Jean", 0, 4), spanEntity("Paul", 10, 14) };
    auto ids = registry.addMany(good);
    REQUIRE(ids.succeeded());
    REQUIRE(ids->size() == 2);
    REQUIRE(registry.size() == 2);
}

TEST_CASE("EntityRegistry - Update", "[registry]") {
    EntityRegistry registry;
    const EntityId id = *registry.add(spanEntity("Jean", 0, 4));

    SECTION("Unknown id") {
        EntityPatch patch;
        patch.text = "Paul";
        REQUIRE(registry.update("missing", patch).error->kind == ErrorKind::NotFound);
    }

    SECTION("Applies every field of the patch") {
        EntityPatch patch;
        patch.text = "Jeanne";
        patch.replacement = "Mme X";
        patch.end_offset = 6;
        auto res = registry.update(id, patch);
        REQUIRE(res.succeeded());
        REQUIRE(res->text == "Jeanne");
        REQUIRE(registry.find(id)->replacement == "Mme X");
        REQUIRE(*registry.find(id)->end_offset == 6);
    }

    SECTION("A failed patch leaves the record untouched") {
        EntityPatch patch;
        patch.text = "Jeanne";
        patch.confidence = 2.0;
        REQUIRE(registry.update(id, patch).error->kind == ErrorKind::Validation);
        REQUIRE(registry.find(id)->text == "Jean");
        REQUIRE(registry.find(id)->confidence == 0.9);
    }

    SECTION("Clearing the span") {
        EntityPatch patch;
        patch.clear_span = true;
        REQUIRE(registry.update(id, patch).succeeded());
        REQUIRE_FALSE(registry.find(id)->hasSpan());
    }

    SECTION("Select requires a replacement") {
        EntityPatch patch;
        patch.replacement = std::string{};
        patch.selected = false;
        REQUIRE(registry.update(id, patch).succeeded());
        REQUIRE(registry.select(id, true).error->kind == ErrorKind::Validation);
        REQUIRE(registry.select(id, false).succeeded());
    }
}

TEST_CASE("EntityRegistry - Remove and list", "[registry]") {
    EntityRegistry registry;
    Entity model = spanEntity("ACME", 20, 24, EntitySource::Model);
    model.type = EntityType::Organization;
    model.confidence = 0.4;
    const EntityId a = *registry.add(spanEntity("Jean", 0, 4));
    const EntityId b = *registry.add(model);
    const EntityId c = *registry.add(spanEntity("Paul", 10, 14));

    SECTION("Filters") {
        EntityFilter by_type;
        by_type.type = EntityType::Organization;
        REQUIRE(registry.list(by_type).size() == 1);

        EntityFilter by_source;
        by_source.source = EntitySource::Pattern;
        REQUIRE(registry.list(by_source).size() == 2);

        EntityFilter by_confidence;
        by_confidence.min_confidence = 0.5;
        auto confident = registry.list(by_confidence);
        REQUIRE(confident.size() == 2);
        REQUIRE(confident[0].id == a);
        REQUIRE(confident[1].id == c);
    }

    SECTION("removeMany with an unknown id removes nothing") {
        REQUIRE(registry.removeMany({ a, "missing" }).error->kind == ErrorKind::NotFound);
        REQUIRE(registry.size() == 3);

        REQUIRE(registry.removeMany({ a, c }).succeeded());
        REQUIRE(registry.size() == 1);
        REQUIRE(registry.find(b) != nullptr);
    }

    SECTION("remove keeps lookups consistent") {
        REQUIRE(registry.remove(a).succeeded());
        REQUIRE(registry.remove(a).error->kind == ErrorKind::NotFound);
        REQUIRE(registry.find(c)->text == "Paul");
    }
}

TEST_CASE("EntityRegistry - Commit", "[registry]") {
    EntityRegistry registry;
    const EntityId a = *registry.add(spanEntity("Jean", 0, 4));

    Entity changed = *registry.find(a);
    changed.replacement = "Y";
    Entity ghost = changed;
    ghost.id = "ghost";

    REQUIRE(registry.commit({ changed, ghost }).error->kind == ErrorKind::NotFound);
    REQUIRE(registry.find(a)->replacement == "X");

    REQUIRE(registry.commit({ changed }).succeeded());
    REQUIRE(registry.find(a)->replacement == "Y");
}
