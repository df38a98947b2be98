#include "BatchCodec.hpp"

#include <cctype>
#include <string_view>

namespace translate
{

static bool is_ascii_space(char c)
{
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

static bool is_whitespace_only(std::string_view s)
{
    for (char c : s)
    {
        if (!is_ascii_space(c))
            return false;
    }
    return true;
}

std::string batch_instructions(std::size_t count)
{
    return "Translate each of the " + std::to_string(count) +
           " segments below independently and keep their order. Each segment starts with a "
           "<<<SEGMENT n>>> line and ends with a <<<END SEGMENT n>>> line; do not copy those marker lines. "
           "Return exactly " +
           std::to_string(count) + " translations separated by the line " + kSegmentDelimiter +
           " and nothing else.";
}

std::string encode_batch(const std::vector<std::string>& texts)
{
    std::string out;
    for (std::size_t i = 0; i < texts.size(); ++i)
    {
        const std::string number = std::to_string(i + 1);
        out += "<<<SEGMENT " + number + ">>>\n";
        out += texts[i];
        if (texts[i].empty() || texts[i].back() != '\n')
            out.push_back('\n');
        out += "<<<END SEGMENT " + number + ">>>\n";
    }
    return out;
}

BatchParseResult parse_batch_response(const std::string& message, std::size_t expected)
{
    BatchParseResult result;
    result.expected = expected;

    const std::string_view delimiter(kSegmentDelimiter);
    std::string_view rest(message);
    std::vector<std::string_view> fragments;
    while (true)
    {
        const auto pos = rest.find(delimiter);
        if (pos == std::string_view::npos)
        {
            fragments.push_back(rest);
            break;
        }
        fragments.push_back(rest.substr(0, pos));
        rest.remove_prefix(pos + delimiter.size());
    }

    while (!fragments.empty() && is_whitespace_only(fragments.back()))
        fragments.pop_back();

    result.received = fragments.size();
    for (auto fragment : fragments)
    {
        if (is_whitespace_only(fragment))
            ++result.blank;
    }
    if (result.received != expected || result.blank > 0)
        return result;

    result.translations.reserve(fragments.size());
    for (auto fragment : fragments)
        result.translations.emplace_back(fragment);
    result.ok = true;
    return result;
}

std::string restore_edge_whitespace(const std::string& source, const std::string& translation)
{
    std::size_t src_begin = 0;
    while (src_begin < source.size() && is_ascii_space(source[src_begin]))
        ++src_begin;
    if (src_begin == source.size())
        return translation;
    std::size_t src_end = source.size();
    while (src_end > src_begin && is_ascii_space(source[src_end - 1]))
        --src_end;

    std::size_t tr_begin = 0;
    while (tr_begin < translation.size() && is_ascii_space(translation[tr_begin]))
        ++tr_begin;
    std::size_t tr_end = translation.size();
    while (tr_end > tr_begin && is_ascii_space(translation[tr_end - 1]))
        --tr_end;

    std::string out;
    out.reserve(src_begin + (tr_end - tr_begin) + (source.size() - src_end));
    out.append(source, 0, src_begin);
    out.append(translation, tr_begin, tr_end - tr_begin);
    out.append(source, src_end, std::string::npos);
    return out;
}

} // namespace translate
