#pragma once

#include "../entity/EntityTypes.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace lexanon
{

// One applied original -> replacement pair, in application order.
struct SubstitutionEntry
{
    std::string original;
    std::string replacement;
    std::size_t match_count = 0;            // 0 when a longer key already consumed it
    std::optional<std::size_t> first_offset; // First occurrence in the input text
    std::vector<EntityId> entity_ids;        // Entities that contributed this key
};

struct SubstitutionResult
{
    std::string anonymized_text;
    std::vector<SubstitutionEntry> audit;

    std::size_t totalMatches() const;
};

struct SubstitutionOptions
{
    // When the text right before a match already ends with the leading
    // words of the replacement ("M. " before "Dupont" -> "M. X"), insert
    // only the remainder. Off means strictly verbatim insertion.
    bool collapse_repeated_prefix = true;
};

/// Computes anonymized text from a set of selected entities.
///
/// Keys are the distinct entity texts, applied longest first (ties: first
/// occurrence in the input, then byte order) with a literal, case-insensitive,
/// global replacement over the working text. `apply` is a pure function of
/// its arguments and may run concurrently on independent documents.
class SubstitutionEngine
{
public:
    explicit SubstitutionEngine(SubstitutionOptions options = {});

    SubstitutionResult apply(const std::string& text, const std::vector<Entity>& selected_entities) const;

    /// The ordered key list `apply` would use, with match counts left at 0.
    std::vector<SubstitutionEntry> plan(const std::string& text, const std::vector<Entity>& selected_entities) const;

    const SubstitutionOptions& options() const { return options_; }

private:
    SubstitutionOptions options_;
};

} // namespace lexanon
