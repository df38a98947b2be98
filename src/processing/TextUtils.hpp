#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace processing
{

/// UTF-8 to UTF-32 conversion; stops at the first malformed sequence
std::u32string utf8ToUtf32(std::string_view utf8_str);

/// UTF-32 to UTF-8 conversion
std::string utf32ToUtf8(std::u32string_view utf32_str);

/// Rejects truncated, overlong and surrogate sequences
bool isValidUtf8(std::string_view utf8_str);

/// Number of Unicode code points; every size limit in the pipeline is measured with this
std::size_t codepointLength(std::string_view utf8_str);

/// True when the text is empty or contains only Unicode whitespace
bool isBlank(std::string_view utf8_str);

bool isSpaceChar(char32_t cp);

/// Strip helpers that mirror the line tests of the Markdown segmenter
std::u32string_view lstripView(std::u32string_view s);
std::u32string_view stripView(std::u32string_view s);

} // namespace processing
