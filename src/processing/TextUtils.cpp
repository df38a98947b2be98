#include "TextUtils.hpp"
#include <utf8proc.h>

namespace processing
{

std::u32string utf8ToUtf32(std::string_view utf8_str)
{
    std::u32string result;
    if (utf8_str.empty())
        return result;

    const utf8proc_uint8_t* str = reinterpret_cast<const utf8proc_uint8_t*>(utf8_str.data());
    utf8proc_ssize_t len = static_cast<utf8proc_ssize_t>(utf8_str.size());

    result.reserve(utf8_str.size());
    utf8proc_ssize_t pos = 0;
    while (pos < len)
    {
        utf8proc_int32_t codepoint;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &codepoint);
        if (bytes <= 0)
            break;
        result.push_back(static_cast<char32_t>(codepoint));
        pos += bytes;
    }
    return result;
}

std::string utf32ToUtf8(std::u32string_view utf32_str)
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

bool isValidUtf8(std::string_view utf8_str)
{
    const utf8proc_uint8_t* str = reinterpret_cast<const utf8proc_uint8_t*>(utf8_str.data());
    utf8proc_ssize_t len = static_cast<utf8proc_ssize_t>(utf8_str.size());
    utf8proc_ssize_t pos = 0;
    while (pos < len)
    {
        utf8proc_int32_t codepoint = -1;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &codepoint);
        if (bytes <= 0 || codepoint < 0)
            return false;
        pos += bytes;
    }
    return true;
}

std::size_t codepointLength(std::string_view utf8_str)
{
    // Continuation bytes are 10xxxxxx; everything else starts a code point.
    std::size_t count = 0;
    for (char c : utf8_str)
    {
        if ((static_cast<unsigned char>(c) & 0xC0u) != 0x80u)
            ++count;
    }
    return count;
}

bool isSpaceChar(char32_t cp)
{
    switch (cp)
    {
    case U' ':
    case U'\t':
    case U'\n':
    case U'\v':
    case U'\f':
    case U'\r':
    case 0x1C:
    case 0x1D:
    case 0x1E:
    case 0x1F:
    case 0x85:
    case 0xA0:
    case 0x1680:
    case 0x2028:
    case 0x2029:
    case 0x202F:
    case 0x205F:
    case 0x3000:
        return true;
    default:
        return cp >= 0x2000 && cp <= 0x200A;
    }
}

bool isBlank(std::string_view utf8_str)
{
    for (char32_t cp : utf8ToUtf32(utf8_str))
    {
        if (!isSpaceChar(cp))
            return false;
    }
    return true;
}

std::u32string_view lstripView(std::u32string_view s)
{
    std::size_t i = 0;
    while (i < s.size() && isSpaceChar(s[i]))
        ++i;
    return s.substr(i);
}

std::u32string_view stripView(std::u32string_view s)
{
    s = lstripView(s);
    std::size_t end = s.size();
    while (end > 0 && isSpaceChar(s[end - 1]))
        --end;
    return s.substr(0, end);
}

} // namespace processing
