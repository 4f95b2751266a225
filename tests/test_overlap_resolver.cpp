#include <catch2/catch_test_macros.hpp>
#include "resolve/OverlapResolver.hpp"
#include "test_helpers.hpp"

#include <algorithm>

using namespace lexanon;

namespace {

const RejectedCandidate* findRejected(const ResolveReport& report, const std::string& id)
{
    auto it = std::find_if(report.rejected.begin(), report.rejected.end(),
                           [&](const RejectedCandidate& r) { return r.candidate.id == id; });
    return it == report.rejected.end() ? nullptr : &*it;
}

Candidate boxCandidate(const std::string& text, int page, double x0, double y0, double x1, double y1)
{
    Candidate c = makeCandidate(text, EntityType::Person, EntitySource::Model, 0.8);
    c.bbox = BoundingBox{ page, x0, y0, x1, y1 };
    return c;
}

} // namespace

TEST_CASE("OverlapResolver - Longest span wins", "[resolver]") {
    const std::string doc = "Domicile: 12 rue des Lilas, Lyon 69001";
    OverlapResolver resolver;

    std::vector<Candidate> candidates{
        makeCandidate("Lyon", EntityType::Address, EntitySource::Model, 0.99, 28, 32),
        makeCandidate("12 rue des Lilas, Lyon 69001", EntityType::Address, EntitySource::Pattern, 0.7, 10, 38),
    };

    auto report = resolver.resolve(candidates, doc);
    REQUIRE(report.accepted.size() == 1);
    REQUIRE(report.accepted[0].id == "c1");
    REQUIRE(report.accepted[0].text == "12 rue des Lilas, Lyon 69001");

    auto* rejected = findRejected(report, "c0");
    REQUIRE(rejected != nullptr);
    REQUIRE(rejected->reason == "subsumed-by: c1");
    REQUIRE(report.ambiguities.empty());
}

TEST_CASE("OverlapResolver - Tie-breaks on equal extent", "[resolver]") {
    const std::string doc = "Jean Dupont";
    OverlapResolver resolver;

    SECTION("Higher confidence") {
        std::vector<Candidate> candidates{
            makeCandidate("Jean Dupont", EntityType::Person, EntitySource::Pattern, 0.6, 0, 11),
            makeCandidate("Jean Dupont", EntityType::Organization, EntitySource::Model, 0.9, 0, 11),
        };
        auto report = resolver.resolve(candidates, doc);
        REQUIRE(report.accepted.size() == 1);
        REQUIRE(report.accepted[0].id == "c1");
        REQUIRE(report.ambiguities.size() == 1);
        REQUIRE(report.ambiguities[0].winner == "c1");
        REQUIRE(report.ambiguities[0].loser == "c0");
        REQUIRE(report.ambiguities[0].rule == "confidence");
    }

    SECTION("Pattern over model at equal confidence") {
        std::vector<Candidate> candidates{
            makeCandidate("Jean Dupont", EntityType::Person, EntitySource::Model, 0.8, 0, 11),
            makeCandidate("Jean Dupont", EntityType::Person, EntitySource::Pattern, 0.8, 0, 11),
        };
        auto report = resolver.resolve(candidates, doc);
        REQUIRE(report.accepted[0].source == EntitySource::Pattern);
        REQUIRE(report.ambiguities[0].rule == "source-priority");
    }

    SECTION("Manual sits between pattern and model") {
        std::vector<Candidate> candidates{
            makeCandidate("Jean Dupont", EntityType::Person, EntitySource::Model, 1.0, 0, 11),
            makeCandidate("Jean Dupont", EntityType::Person, EntitySource::Manual, 1.0, 0, 11),
        };
        auto report = resolver.resolve(candidates, doc);
        REQUIRE(report.accepted[0].source == EntitySource::Manual);
    }

    SECTION("Input order as the last resort") {
        std::vector<Candidate> candidates{
            makeCandidate("Jean Dupont", EntityType::Person, EntitySource::Model, 0.8, 0, 11),
            makeCandidate("Jean Dupont", EntityType::Organization, EntitySource::Model, 0.8, 0, 11),
        };
        auto report = resolver.resolve(candidates, doc);
        REQUIRE(report.accepted[0].id == "c0");
        REQUIRE(report.ambiguities[0].rule == "input-order");
    }
}

TEST_CASE("OverlapResolver - Greedy schedule", "[resolver]") {
    const std::string doc = "abcdefghijk";
    OverlapResolver resolver;

    std::vector<Candidate> candidates{
        makeCandidate("abcde", EntityType::Other, EntitySource::Pattern, 0.5, 0, 5),
        makeCandidate("defgh", EntityType::Other, EntitySource::Pattern, 0.5, 3, 8),
        makeCandidate("ghijk", EntityType::Other, EntitySource::Pattern, 0.5, 6, 11),
    };

    auto report = resolver.resolve(candidates, doc);
    REQUIRE(report.accepted.size() == 2);
    REQUIRE(report.accepted[0].id == "c0");
    REQUIRE(report.accepted[1].id == "c2");
    REQUIRE(findRejected(report, "c1")->reason == "subsumed-by: c0");

    SECTION("Accepted set never overlaps") {
        for (std::size_t i = 0; i + 1 < report.accepted.size(); ++i)
            REQUIRE(*report.accepted[i].end_offset <= *report.accepted[i + 1].start_offset);
    }
}

TEST_CASE("OverlapResolver - Spatial detections", "[resolver][bbox]") {
    OverlapResolver resolver;

    SECTION("Overlapping boxes keep the larger one") {
        std::vector<Candidate> candidates{
            boxCandidate("Dupont", 1, 10, 10, 20, 20),
            boxCandidate("Jean Dupont", 1, 0, 10, 20, 20),
        };
        auto report = resolver.resolve(candidates, "");
        REQUIRE(report.accepted.size() == 1);
        REQUIRE(report.accepted[0].id == "c1");
        REQUIRE(report.accepted[0].occurrences == 0);
    }

    SECTION("Different pages never conflict") {
        std::vector<Candidate> candidates{
            boxCandidate("Dupont", 1, 0, 0, 10, 10),
            boxCandidate("Martin", 2, 0, 0, 10, 10),
        };
        REQUIRE(resolver.resolve(candidates, "").accepted.size() == 2);
    }

    SECTION("Boxes are not compared with offset spans and go last") {
        std::vector<Candidate> candidates{
            boxCandidate("Martin", 1, 0, 0, 10, 10),
            makeCandidate("Dupont", EntityType::Person, EntitySource::Pattern, 0.9, 0, 6),
        };
        auto report = resolver.resolve(candidates, "Dupont");
        REQUIRE(report.accepted.size() == 2);
        REQUIRE(report.accepted[0].id == "c1");
        REQUIRE(report.accepted[1].id == "c0");
    }
}

TEST_CASE("OverlapResolver - Validation pre-pass", "[resolver]") {
    ResolverOptions options;
    options.min_confidence = 0.5;
    OverlapResolver resolver(options);

    Candidate named = makeCandidate("Paul", EntityType::Person, EntitySource::Model, 0.9, 20, 24);
    named.id = "paul";
    Candidate twin = named;
    twin.start_offset = 30;
    twin.end_offset = 34;

    std::vector<Candidate> candidates{
        makeCandidate("", EntityType::Person, EntitySource::Model, 0.9, 0, 1),
        makeCandidate("Jean", EntityType::Person, EntitySource::Model, 1.5, 0, 4),
        makeCandidate("Jean", EntityType::Person, EntitySource::Model, 0.3, 0, 4),
        makeCandidate("Jean", EntityType::Person, EntitySource::Model, 0.9, 4, 4),
        named,
        twin,
    };

    auto report = resolver.resolve(candidates, "Jean");
    REQUIRE(report.accepted.size() == 1);
    REQUIRE(report.accepted[0].id == "paul");

    REQUIRE(findRejected(report, "c0")->reason == "invalid: entity text is empty");
    REQUIRE(findRejected(report, "c1")->reason == "invalid: confidence must be within [0, 1]");
    REQUIRE(findRejected(report, "c2")->reason == "below-threshold");
    REQUIRE(findRejected(report, "c3")->reason.rfind("invalid: ", 0) == 0);
    REQUIRE(report.rejected.size() == 5);
}

TEST_CASE("OverlapResolver - Text deduplication", "[resolver][dedup]") {
    const std::string doc = "Dupont a vu DUPONT puis Dupont.";
    std::vector<Candidate> candidates{
        makeCandidate("Dupont", EntityType::Person, EntitySource::Model, 0.7, 0, 6),
        makeCandidate("DUPONT", EntityType::Person, EntitySource::Model, 0.9, 12, 18),
        makeCandidate("Dupont", EntityType::Organization, EntitySource::Model, 0.7, 24, 30),
    };

    SECTION("Enabled: one entity per text and type") {
        OverlapResolver resolver;
        auto report = resolver.resolve(candidates, doc);
        REQUIRE(report.accepted.size() == 2);
        REQUIRE(report.accepted[0].id == "c1");
        REQUIRE(report.accepted[1].id == "c2");
        REQUIRE(findRejected(report, "c0")->reason == "duplicate-of: c1");
        REQUIRE(report.accepted[0].occurrences == 3);
    }

    SECTION("Disabled: every non-overlapping detection survives") {
        ResolverOptions options;
        options.deduplicate_text = false;
        OverlapResolver resolver(options);
        auto report = resolver.resolve(candidates, doc);
        REQUIRE(report.accepted.size() == 3);
        REQUIRE(report.rejected.empty());
    }
}

TEST_CASE("OverlapResolver - Deduplication across sources", "[resolver][dedup]") {
    const std::string doc = "Dupont a vu DUPONT puis Dupont.";

    SECTION("Higher confidence wins before source priority") {
        std::vector<Candidate> candidates{
            makeCandidate("Dupont", EntityType::Person, EntitySource::Pattern, 0.6, 0, 6),
            makeCandidate("Dupont", EntityType::Person, EntitySource::Model, 0.95, 24, 30),
        };
        auto report = OverlapResolver().resolve(candidates, doc);
        REQUIRE(report.accepted.size() == 1);
        REQUIRE(report.accepted[0].id == "c1");
        REQUIRE(report.accepted[0].source == EntitySource::Model);
        REQUIRE(findRejected(report, "c0")->reason == "duplicate-of: c1");
    }

    SECTION("Equal confidence falls back to source priority") {
        std::vector<Candidate> candidates{
            makeCandidate("Dupont", EntityType::Person, EntitySource::Model, 0.8, 0, 6),
            makeCandidate("Dupont", EntityType::Person, EntitySource::Pattern, 0.8, 24, 30),
        };
        auto report = OverlapResolver().resolve(candidates, doc);
        REQUIRE(report.accepted.size() == 1);
        REQUIRE(report.accepted[0].id == "c1");
        REQUIRE(findRejected(report, "c0")->reason == "duplicate-of: c1");
    }

}

TEST_CASE("OverlapResolver - overlaps()", "[resolver]") {
    auto a = makeCandidate("a", EntityType::Other, EntitySource::Pattern, 1.0, 0, 5);
    auto b = makeCandidate("b", EntityType::Other, EntitySource::Pattern, 1.0, 5, 9);
    auto c = makeCandidate("c", EntityType::Other, EntitySource::Pattern, 1.0, 4, 6);
    auto loose = makeCandidate("d", EntityType::Other, EntitySource::Pattern, 1.0);

    REQUIRE_FALSE(OverlapResolver::overlaps(a, b));
    REQUIRE(OverlapResolver::overlaps(a, c));
    REQUIRE(OverlapResolver::overlaps(b, c));
    REQUIRE_FALSE(OverlapResolver::overlaps(a, loose));
}
