#include "SubstitutionEngine.hpp"
#include "../text/LiteralMatcher.hpp"
#include "../text/TextUtils.hpp"
#include "../utils/Diagnostics.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <limits>
#include <unordered_map>

namespace lexanon
{

namespace
{

constexpr std::size_t kAbsent = std::numeric_limits<std::size_t>::max();

struct PlannedKey
{
    SubstitutionEntry entry;
    std::size_t length = 0;
    bool from_group = false;
};

// Longest leading part of `replacement` ending at a space that the text
// before `pos` already ends with; returns the length to drop.
std::size_t repeatedPrefixLength(const std::u32string& folded_text, std::size_t pos,
                                 const std::u32string& folded_replacement)
{
    for (std::size_t i = folded_replacement.size(); i-- > 0;)
    {
        if (folded_replacement[i] != U' ' || i + 1 >= folded_replacement.size())
            continue;
        const std::size_t prefix_len = i + 1;
        if (prefix_len > pos)
            continue;
        if (folded_text.compare(pos - prefix_len, prefix_len, folded_replacement, 0, prefix_len) == 0)
            return prefix_len;
    }
    return 0;
}

} // namespace

std::size_t SubstitutionResult::totalMatches() const
{
    std::size_t total = 0;
    for (const auto& e : audit)
        total += e.match_count;
    return total;
}

SubstitutionEngine::SubstitutionEngine(SubstitutionOptions options)
    : options_(options)
{
}

std::vector<SubstitutionEntry> SubstitutionEngine::plan(const std::string& text,
                                                        const std::vector<Entity>& selected_entities) const
{
    const text::FoldedText source(text);

    std::vector<PlannedKey> keys;
    std::unordered_map<std::string, std::size_t> by_original;

    for (const auto& entity : selected_entities)
    {
        if (entity.text.empty() || entity.replacement.empty())
        {
            PLOG_DEBUG_(utils::Diagnostics::kLogInstance)
                << "[SubstitutionEngine] skipping " << entity.id << ": empty text or replacement";
            continue;
        }

        // Matching ignores case, so spellings that fold together share one key
        std::string folded = text::foldCaseUtf8(entity.text);
        auto it = by_original.find(folded);
        if (it != by_original.end())
        {
            PlannedKey& existing = keys[it->second];
            existing.entry.entity_ids.push_back(entity.id);
            if (existing.entry.replacement == entity.replacement)
                continue;

            // Same text, different replacements: a group's value wins over
            // an individual one, otherwise the first entity seen wins.
            PLOG_WARNING_(utils::Diagnostics::kLogInstance)
                << "[SubstitutionEngine] conflicting replacements for one text (entities "
                << existing.entry.entity_ids.front() << ", " << entity.id << ")";
            if (!existing.from_group && entity.group_id)
            {
                existing.entry.replacement = entity.replacement;
                existing.from_group = true;
            }
            continue;
        }

        PlannedKey key;
        key.entry.original = entity.text;
        key.entry.replacement = entity.replacement;
        key.entry.entity_ids.push_back(entity.id);
        key.entry.first_offset = source.findFirst(entity.text);
        key.length = text::codepointLength(entity.text);
        key.from_group = entity.group_id.has_value();

        by_original.emplace(std::move(folded), keys.size());
        keys.push_back(std::move(key));
    }

    std::sort(keys.begin(), keys.end(),
              [](const PlannedKey& a, const PlannedKey& b)
              {
                  if (a.length != b.length)
                      return a.length > b.length;
                  const std::size_t fa = a.entry.first_offset.value_or(kAbsent);
                  const std::size_t fb = b.entry.first_offset.value_or(kAbsent);
                  if (fa != fb)
                      return fa < fb;
                  return a.entry.original < b.entry.original;
              });

    std::vector<SubstitutionEntry> ordered;
    ordered.reserve(keys.size());
    for (auto& key : keys)
        ordered.push_back(std::move(key.entry));
    return ordered;
}

SubstitutionResult SubstitutionEngine::apply(const std::string& text,
                                             const std::vector<Entity>& selected_entities) const
{
    SubstitutionResult result;
    result.audit = plan(text, selected_entities);

    text::FoldedText working(text);
    for (auto& entry : result.audit)
    {
        const std::u32string folded_original = text::foldCase(text::utf8ToUtf32(entry.original));
        const std::u32string replacement = text::utf8ToUtf32(entry.replacement);

        if (!options_.collapse_repeated_prefix)
        {
            entry.match_count = working.replaceAll(folded_original, replacement);
            continue;
        }

        const std::u32string folded_replacement = text::foldCase(replacement);
        const std::u32string& before = working.folded();
        entry.match_count = working.replaceAll(
            folded_original,
            [&](std::size_t pos)
            {
                const std::size_t drop = repeatedPrefixLength(before, pos, folded_replacement);
                return drop == 0 ? replacement : replacement.substr(drop);
            });

        if (entry.match_count == 0)
        {
            PLOG_DEBUG_(utils::Diagnostics::kLogInstance)
                << "[SubstitutionEngine] no match left for " << utils::Diagnostics::Describe(entry.original);
        }
    }

    result.anonymized_text = working.toUtf8();
    PLOG_INFO_(utils::Diagnostics::kLogInstance) << "[SubstitutionEngine] applied " << result.audit.size()
                                                 << " keys, " << result.totalMatches() << " replacements";
    return result;
}

} // namespace lexanon
