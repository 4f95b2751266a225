#include "TextUtils.hpp"
#include <utf8proc.h>

namespace lexanon::text
{

std::u32string utf8ToUtf32(const std::string& utf8_str)
{
    std::u32string result;
    if (utf8_str.empty())
        return result;

    result.reserve(utf8_str.size());
    const utf8proc_uint8_t* str = reinterpret_cast<const utf8proc_uint8_t*>(utf8_str.c_str());
    utf8proc_ssize_t len = static_cast<utf8proc_ssize_t>(utf8_str.size());

    utf8proc_ssize_t pos = 0;
    while (pos < len)
    {
        utf8proc_int32_t codepoint;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &codepoint);
        if (bytes <= 0)
        {
            result.push_back(kReplacementChar);
            ++pos;
            continue;
        }
        result.push_back(static_cast<char32_t>(codepoint));
        pos += bytes;
    }
    return result;
}

std::string utf32ToUtf8(const std::u32string& utf32_str)
{
    std::string result;
    result.reserve(utf32_str.size());
    for (char32_t cp : utf32_str)
    {
        utf8proc_uint8_t buffer[4];
        utf8proc_ssize_t bytes = utf8proc_encode_char(static_cast<utf8proc_int32_t>(cp), buffer);
        if (bytes > 0)
        {
            result.append(reinterpret_cast<const char*>(buffer), static_cast<size_t>(bytes));
        }
    }
    return result;
}

char32_t foldChar(char32_t cp)
{
    return static_cast<char32_t>(utf8proc_tolower(static_cast<utf8proc_int32_t>(cp)));
}

std::u32string foldCase(const std::u32string& s)
{
    std::u32string out;
    out.reserve(s.size());
    for (char32_t cp : s)
        out.push_back(foldChar(cp));
    return out;
}

std::string foldCaseUtf8(const std::string& utf8_str) { return utf32ToUtf8(foldCase(utf8ToUtf32(utf8_str))); }

std::size_t codepointLength(const std::string& utf8_str) { return utf8ToUtf32(utf8_str).size(); }

std::string trim(const std::string& utf8_str)
{
    std::u32string s = utf8ToUtf32(utf8_str);
    auto is_space = [](char32_t cp)
    {
        auto cat = utf8proc_category(static_cast<utf8proc_int32_t>(cp));
        return cp == U'\t' || cp == U'\n' || cp == U'\r' || cp == U'\v' || cp == U'\f' ||
               cat == UTF8PROC_CATEGORY_ZS;
    };

    std::size_t begin = 0;
    while (begin < s.size() && is_space(s[begin]))
        ++begin;
    std::size_t end = s.size();
    while (end > begin && is_space(s[end - 1]))
        --end;
    return utf32ToUtf8(s.substr(begin, end - begin));
}

} // namespace lexanon::text
