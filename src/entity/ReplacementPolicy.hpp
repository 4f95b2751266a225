#pragma once

#include "EntityTypes.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>

namespace lexanon
{

/// Type-specific default replacements and default selection state.
///
/// Templates may contain `{hash}` (stable text hash mod 1000) and `{n}`
/// (hash mod 99 + 1). The hash only depends on the case-folded text, so the
/// same entity always regenerates the same default.
class ReplacementPolicy
{
public:
    ReplacementPolicy();

    std::string defaultReplacement(EntityType type, const std::string& text) const;
    bool defaultSelected(EntityType type) const;

    void setTemplate(EntityType type, std::string tmpl);
    void setDefaultSelected(EntityType type, bool selected);
    const std::string& templateFor(EntityType type) const;

    /// FNV-1a (32-bit) over the case-folded UTF-8 text
    static std::uint32_t stableHash(const std::string& text);

private:
    struct TypeRule
    {
        std::string replacement_template;
        bool default_selected = true;
    };

    std::unordered_map<EntityType, TypeRule> rules_;
};

} // namespace lexanon
