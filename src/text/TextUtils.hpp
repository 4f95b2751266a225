#pragma once

#include <cstddef>
#include <string>

namespace lexanon::text
{

/// UTF-8 to UTF-32 conversion. Malformed bytes decode to U+FFFD.
std::u32string utf8ToUtf32(const std::string& utf8_str);

/// UTF-32 to UTF-8 conversion
std::string utf32ToUtf8(const std::u32string& utf32_str);

/// Simple (one-to-one) lower-case folding, so folded strings keep the
/// code-point offsets of their source.
char32_t foldChar(char32_t cp);
std::u32string foldCase(const std::u32string& s);
std::string foldCaseUtf8(const std::string& utf8_str);

/// Number of code points in a UTF-8 string
std::size_t codepointLength(const std::string& utf8_str);

/// Trims ASCII and Unicode white space at both ends
std::string trim(const std::string& utf8_str);

constexpr char32_t kReplacementChar = U'\uFFFD';

} // namespace lexanon::text
