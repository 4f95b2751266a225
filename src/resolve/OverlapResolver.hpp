#pragma once

#include "../entity/EntityTypes.hpp"

#include <string>
#include <vector>

namespace lexanon
{

struct ResolverOptions
{
    bool deduplicate_text = true; // Merge accepted entities with the same folded text and type
    double min_confidence = 0.0;
};

struct RejectedCandidate
{
    Candidate candidate;
    std::string reason; // "subsumed-by: <id>", "duplicate-of: <id>", "invalid: ...", "below-threshold"
};

// Two overlapping candidates of equal extent, decided by a secondary rule.
// Observability only.
struct OverlapAmbiguity
{
    EntityId winner;
    EntityId loser;
    std::string rule; // "confidence", "source-priority" or "input-order"
};

struct ResolveReport
{
    std::vector<Entity> accepted; // Non-overlapping, ordered by start offset
    std::vector<RejectedCandidate> rejected;
    std::vector<OverlapAmbiguity> ambiguities;
};

/// Turns the unfiltered candidate list of every detector into one
/// non-overlapping working set.
///
/// Candidates are ranked by extent (span length, or box area for spatial
/// detections) descending, then confidence descending, then source priority
/// (pattern > manual > model), then input order. A greedy sweep accepts a
/// candidate only when it overlaps nothing accepted so far.
class OverlapResolver
{
public:
    explicit OverlapResolver(ResolverOptions options = {});

    ResolveReport resolve(const std::vector<Candidate>& candidates, const std::string& document_text) const;

    const ResolverOptions& options() const { return options_; }

    /// Offset spans are compared with offset spans, boxes with boxes.
    static bool overlaps(const Candidate& a, const Candidate& b);

private:
    ResolverOptions options_;
};

} // namespace lexanon
