#include "OverlapResolver.hpp"
#include "../entity/EntityRegistry.hpp"
#include "../text/LiteralMatcher.hpp"
#include "../text/TextUtils.hpp"
#include "../utils/Diagnostics.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <cmath>
#include <unordered_map>
#include <unordered_set>

namespace lexanon
{

namespace
{

struct Ranked
{
    Candidate candidate;
    std::size_t input_index = 0;
    double extent = 0.0;
};

double extentOf(const Candidate& c)
{
    if (c.start_offset && c.end_offset)
        return static_cast<double>(*c.end_offset - *c.start_offset);
    if (c.bbox)
        return c.bbox->area();
    return static_cast<double>(text::codepointLength(c.text));
}

// Strict weak order: true when `a` is considered before `b` by the sweep.
bool sweepOrder(const Ranked& a, const Ranked& b)
{
    if (a.extent != b.extent)
        return a.extent > b.extent;
    if (a.candidate.confidence != b.candidate.confidence)
        return a.candidate.confidence > b.candidate.confidence;
    const int pa = sourcePriority(a.candidate.source);
    const int pb = sourcePriority(b.candidate.source);
    if (pa != pb)
        return pa > pb;
    return a.input_index < b.input_index;
}

// Which rule separated two candidates of equal extent.
std::string decidingRule(const Ranked& winner, const Ranked& loser)
{
    if (winner.candidate.confidence != loser.candidate.confidence)
        return "confidence";
    if (sourcePriority(winner.candidate.source) != sourcePriority(loser.candidate.source))
        return "source-priority";
    return "input-order";
}

std::string invalidReason(const Candidate& c)
{
    Entity probe;
    probe.text = c.text;
    probe.start_offset = c.start_offset;
    probe.end_offset = c.end_offset;
    probe.bbox = c.bbox;
    probe.confidence = c.confidence;
    auto st = EntityRegistry::validate(probe);
    return st ? std::string{} : st.error->message;
}

Entity toEntity(const Candidate& c, const text::FoldedText& document)
{
    Entity e;
    e.id = c.id;
    e.text = c.text;
    e.type = c.type;
    e.source = c.source;
    e.start_offset = c.start_offset;
    e.end_offset = c.end_offset;
    e.bbox = c.bbox;
    e.confidence = c.source == EntitySource::Manual ? 1.0 : c.confidence;
    e.occurrences = document.count(c.text);
    return e;
}

} // namespace

OverlapResolver::OverlapResolver(ResolverOptions options)
    : options_(options)
{
}

bool OverlapResolver::overlaps(const Candidate& a, const Candidate& b)
{
    const bool span_a = a.start_offset && a.end_offset;
    const bool span_b = b.start_offset && b.end_offset;
    if (span_a && span_b)
        return *a.start_offset < *b.end_offset && *b.start_offset < *a.end_offset;
    if (!span_a && !span_b && a.bbox && b.bbox)
        return a.bbox->overlaps(*b.bbox);
    return false;
}

ResolveReport OverlapResolver::resolve(const std::vector<Candidate>& candidates,
                                       const std::string& document_text) const
{
    ResolveReport report;

    // Validation pre-pass and id assignment
    std::vector<Ranked> ranked;
    ranked.reserve(candidates.size());
    std::unordered_set<std::string> used_ids;
    for (const auto& c : candidates)
    {
        if (!c.id.empty())
            used_ids.insert(c.id);
    }

    std::unordered_set<std::string> seen_ids;
    for (std::size_t i = 0; i < candidates.size(); ++i)
    {
        Candidate c = candidates[i];
        if (c.id.empty())
        {
            std::size_t n = i;
            do
            {
                c.id = "c" + std::to_string(n++);
            } while (used_ids.count(c.id) != 0);
            used_ids.insert(c.id);
        }
        else if (!seen_ids.insert(c.id).second)
        {
            report.rejected.push_back({ c, "invalid: duplicate candidate id" });
            continue;
        }

        if (auto reason = invalidReason(c); !reason.empty())
        {
            report.rejected.push_back({ c, "invalid: " + reason });
            continue;
        }
        if (c.confidence < options_.min_confidence)
        {
            report.rejected.push_back({ c, "below-threshold" });
            continue;
        }

        Ranked r;
        r.extent = extentOf(c);
        r.input_index = i;
        r.candidate = std::move(c);
        ranked.push_back(std::move(r));
    }

    std::sort(ranked.begin(), ranked.end(), sweepOrder);

    // Greedy interval-scheduling sweep
    std::vector<Ranked> kept;
    kept.reserve(ranked.size());
    for (auto& r : ranked)
    {
        auto blocker = std::find_if(kept.begin(), kept.end(),
                                    [&](const Ranked& k) { return overlaps(k.candidate, r.candidate); });
        if (blocker == kept.end())
        {
            kept.push_back(std::move(r));
            continue;
        }

        if (blocker->extent == r.extent)
        {
            OverlapAmbiguity amb{ blocker->candidate.id, r.candidate.id, decidingRule(*blocker, r) };
            PLOG_DEBUG_(utils::Diagnostics::kLogInstance)
                << "[OverlapResolver] ambiguity: " << amb.winner << " over " << amb.loser << " by " << amb.rule;
            report.ambiguities.push_back(std::move(amb));
        }
        report.rejected.push_back({ r.candidate, "subsumed-by: " + blocker->candidate.id });
    }

    if (options_.deduplicate_text)
    {
        // Same ranking as the sweep: the first of each text and type wins
        std::vector<Ranked> by_priority = std::move(kept);
        std::sort(by_priority.begin(), by_priority.end(), sweepOrder);

        std::unordered_map<std::string, EntityId> first_by_key;
        kept.clear();
        for (auto& r : by_priority)
        {
            std::string key = text::foldCaseUtf8(text::trim(r.candidate.text));
            key += '\x1f';
            key += toString(r.candidate.type);

            auto [it, inserted] = first_by_key.emplace(key, r.candidate.id);
            if (inserted)
                kept.push_back(std::move(r));
            else
                report.rejected.push_back({ r.candidate, "duplicate-of: " + it->second });
        }
    }

    // Document order for the accepted set; spatial-only detections last
    std::stable_sort(kept.begin(), kept.end(),
                     [](const Ranked& a, const Ranked& b)
                     {
                         const bool sa = a.candidate.start_offset.has_value();
                         const bool sb = b.candidate.start_offset.has_value();
                         if (sa != sb)
                             return sa;
                         if (!sa)
                             return false;
                         return *a.candidate.start_offset < *b.candidate.start_offset;
                     });

    const text::FoldedText document(document_text);
    report.accepted.reserve(kept.size());
    for (const auto& r : kept)
        report.accepted.push_back(toEntity(r.candidate, document));

    PLOG_INFO_(utils::Diagnostics::kLogInstance)
        << "[OverlapResolver] " << candidates.size() << " candidates -> " << report.accepted.size() << " accepted, "
        << report.rejected.size() << " rejected, " << report.ambiguities.size() << " ambiguities";
    return report;
}

} // namespace lexanon
