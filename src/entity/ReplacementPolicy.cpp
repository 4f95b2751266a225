#include "ReplacementPolicy.hpp"
#include "../text/TextUtils.hpp"

namespace lexanon
{

namespace
{

void replaceToken(std::string& s, const std::string& token, const std::string& value)
{
    std::size_t pos = s.find(token);
    while (pos != std::string::npos)
    {
        s.replace(pos, token.size(), value);
        pos = s.find(token, pos + value.size());
    }
}

} // namespace

ReplacementPolicy::ReplacementPolicy()
{
    rules_[EntityType::Person] = { "M. PERSONNE_{hash}", true };
    rules_[EntityType::Organization] = { "ORGANISATION_{hash}", true };
    rules_[EntityType::Phone] = { "0X XX XX XX XX", true };
    rules_[EntityType::Email] = { "contact@anonyme.fr", true };
    rules_[EntityType::NationalId] = { "X XX XX XX XXX XXX XX", true };
    rules_[EntityType::RegistryNumber] = { "XXX XXX XXX XXXXX", true };
    rules_[EntityType::Address] = { "{n} rue de la Paix, 75001 Paris", true };
    // Legal references are reviewed by hand, so they start unselected
    rules_[EntityType::LegalReference] = { "N° RG {hash}", false };
    rules_[EntityType::Other] = { "ANONYME_{hash}", true };
}

std::uint32_t ReplacementPolicy::stableHash(const std::string& text)
{
    const std::string folded = text::foldCaseUtf8(text);
    std::uint32_t hash = 2166136261u;
    for (unsigned char c : folded)
    {
        hash ^= c;
        hash *= 16777619u;
    }
    return hash;
}

std::string ReplacementPolicy::defaultReplacement(EntityType type, const std::string& text) const
{
    const std::uint32_t h = stableHash(text) % 1000u;
    std::string out = templateFor(type);
    replaceToken(out, "{hash}", std::to_string(h));
    replaceToken(out, "{n}", std::to_string(h % 99u + 1u));
    return out;
}

bool ReplacementPolicy::defaultSelected(EntityType type) const
{
    auto it = rules_.find(type);
    return it == rules_.end() ? true : it->second.default_selected;
}

void ReplacementPolicy::setTemplate(EntityType type, std::string tmpl)
{
    if (tmpl.empty())
        return;
    rules_[type].replacement_template = std::move(tmpl);
}

void ReplacementPolicy::setDefaultSelected(EntityType type, bool selected) { rules_[type].default_selected = selected; }

const std::string& ReplacementPolicy::templateFor(EntityType type) const
{
    auto it = rules_.find(type);
    if (it == rules_.end() || it->second.replacement_template.empty())
        return rules_.at(EntityType::Other).replacement_template;
    return it->second.replacement_template;
}

} // namespace lexanon
