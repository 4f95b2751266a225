#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace lexanon::text
{

/// A document decoded once to UTF-32 together with its case-folded copy.
/// All matching is literal (no pattern syntax) and case-insensitive; the
/// positions returned are code-point offsets into the original text.
class FoldedText
{
public:
    FoldedText() = default;
    explicit FoldedText(const std::string& utf8_text);
    explicit FoldedText(std::u32string text);

    const std::u32string& original() const { return original_; }
    const std::u32string& folded() const { return folded_; }
    std::size_t size() const { return original_.size(); }

    /// Left-to-right, non-overlapping match positions of `needle`.
    std::vector<std::size_t> findAll(const std::string& needle) const;
    std::vector<std::size_t> findAllFolded(const std::u32string& folded_needle) const;

    std::optional<std::size_t> findFirst(const std::string& needle) const;
    std::size_t count(const std::string& needle) const;

    /// Replaces every match of `folded_needle` with `replacement` (inserted
    /// verbatim) and refreshes the folded copy. Returns the match count.
    std::size_t replaceAll(const std::u32string& folded_needle, const std::u32string& replacement);

    /// Same, with the inserted text chosen per match from its position in
    /// the text as it was before this call.
    using ReplacementFn = std::function<std::u32string(std::size_t match_pos)>;
    std::size_t replaceAll(const std::u32string& folded_needle, const ReplacementFn& replacement_for);

    std::string toUtf8() const;

private:
    std::u32string original_;
    std::u32string folded_;
};

} // namespace lexanon::text
