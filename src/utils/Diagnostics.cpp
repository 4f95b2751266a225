#include "Diagnostics.hpp"

#include <algorithm>

namespace utils
{

std::atomic<bool> Diagnostics::verbose_{ false };
std::atomic<std::size_t> Diagnostics::max_preview_{ 160 };

void Diagnostics::SetVerbose(bool enabled) noexcept
{
    verbose_.store(enabled, std::memory_order_relaxed);
}

bool Diagnostics::IsVerbose() noexcept { return verbose_.load(std::memory_order_relaxed); }

void Diagnostics::SetMaxPreview(std::size_t bytes) noexcept
{
    if (bytes == 0)
        bytes = 1;
    max_preview_.store(bytes, std::memory_order_relaxed);
}

std::size_t Diagnostics::MaxPreview() noexcept { return max_preview_.load(std::memory_order_relaxed); }

std::string Diagnostics::Preview(std::string_view text)
{
    // Cut on a UTF-8 lead byte so accented names are never split mid-sequence
    std::size_t cut = std::min(text.size(), MaxPreview());
    while (cut > 0 && cut < text.size() && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80)
        --cut;

    std::string out;
    out.reserve(cut + 24);
    for (char ch : text.substr(0, cut))
    {
        if (ch == '\n')
            out += "\\n";
        else if (ch == '\r')
            out += "\\r";
        else if (ch == '\t')
            out += "\\t";
        else
            out.push_back(ch);
    }

    if (cut < text.size())
        out += "... (" + std::to_string(text.size()) + " bytes)";

    sanitize(out);
    return out;
}

std::string Diagnostics::Describe(std::string_view text)
{
    if (IsVerbose())
        return "'" + Preview(text) + "'";
    return "<" + std::to_string(text.size()) + " bytes>";
}

void Diagnostics::sanitize(std::string& text)
{
    auto is_control = [](unsigned char c)
    {
        return c < 0x20 && c != '\n' && c != '\r' && c != '\t';
    };
    std::replace_if(text.begin(), text.end(), is_control, '?');
}

} // namespace utils
