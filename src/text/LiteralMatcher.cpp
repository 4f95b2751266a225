#include "LiteralMatcher.hpp"
#include "TextUtils.hpp"

namespace lexanon::text
{

FoldedText::FoldedText(const std::string& utf8_text)
    : FoldedText(utf8ToUtf32(utf8_text))
{
}

FoldedText::FoldedText(std::u32string text)
    : original_(std::move(text))
    , folded_(foldCase(original_))
{
}

std::vector<std::size_t> FoldedText::findAll(const std::string& needle) const
{
    return findAllFolded(foldCase(utf8ToUtf32(needle)));
}

std::vector<std::size_t> FoldedText::findAllFolded(const std::u32string& folded_needle) const
{
    std::vector<std::size_t> positions;
    if (folded_needle.empty())
        return positions;

    std::size_t pos = folded_.find(folded_needle);
    while (pos != std::u32string::npos)
    {
        positions.push_back(pos);
        pos = folded_.find(folded_needle, pos + folded_needle.size());
    }
    return positions;
}

std::optional<std::size_t> FoldedText::findFirst(const std::string& needle) const
{
    const std::u32string folded_needle = foldCase(utf8ToUtf32(needle));
    if (folded_needle.empty())
        return std::nullopt;

    std::size_t pos = folded_.find(folded_needle);
    if (pos == std::u32string::npos)
        return std::nullopt;
    return pos;
}

std::size_t FoldedText::count(const std::string& needle) const { return findAll(needle).size(); }

std::size_t FoldedText::replaceAll(const std::u32string& folded_needle, const std::u32string& replacement)
{
    return replaceAll(folded_needle, [&replacement](std::size_t) { return replacement; });
}

std::size_t FoldedText::replaceAll(const std::u32string& folded_needle, const ReplacementFn& replacement_for)
{
    const std::vector<std::size_t> positions = findAllFolded(folded_needle);
    if (positions.empty())
        return 0;

    std::u32string out;
    out.reserve(original_.size());

    std::size_t cursor = 0;
    for (std::size_t pos : positions)
    {
        out.append(original_, cursor, pos - cursor);
        out.append(replacement_for(pos));
        cursor = pos + folded_needle.size();
    }
    out.append(original_, cursor, std::u32string::npos);

    original_ = std::move(out);
    folded_ = foldCase(original_);
    return positions.size();
}

std::string FoldedText::toUtf8() const { return utf32ToUtf8(original_); }

} // namespace lexanon::text
