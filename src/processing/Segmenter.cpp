#include "Segmenter.hpp"
#include "TextUtils.hpp"

#include <algorithm>

namespace processing
{

namespace
{

constexpr std::u32string_view kFrontMatterDelimiter = U"---";

// Keeps "\n", "\r\n" and "\r" terminators attached to their line.
std::vector<std::u32string_view> split_lines_keep_ends(std::u32string_view text)
{
    std::vector<std::u32string_view> lines;
    std::size_t start = 0;
    std::size_t i = 0;
    while (i < text.size())
    {
        const char32_t c = text[i];
        if (c == U'\n' || c == U'\r')
        {
            std::size_t end = i + 1;
            if (c == U'\r' && end < text.size() && text[end] == U'\n')
                ++end;
            lines.push_back(text.substr(start, end - start));
            start = end;
            i = end;
            continue;
        }
        ++i;
    }
    if (start < text.size())
        lines.push_back(text.substr(start));
    return lines;
}

// Opening fence of a code block: a run of three or more identical backticks or tildes.
std::u32string_view fence_marker(std::u32string_view line)
{
    const auto stripped = lstripView(line);
    if (stripped.empty() || (stripped.front() != U'`' && stripped.front() != U'~'))
        return {};

    std::size_t run = 1;
    while (run < stripped.size() && stripped[run] == stripped.front())
        ++run;
    if (run < 3)
        return {};
    return stripped.substr(0, run);
}

bool is_sentence_terminator(char32_t c)
{
    switch (c)
    {
    case U'.':
    case U'!':
    case U'?':
    case U';':
    case U'\u3002': // 。
    case U'\uFF01': // ！
    case U'\uFF1F': // ？
    case U'\uFF1B': // ；
        return true;
    default:
        return false;
    }
}

// End of text, or just before a single trailing newline.
bool at_text_end(std::u32string_view text, std::size_t pos)
{
    return pos == text.size() || (pos + 1 == text.size() && text[pos] == U'\n');
}

// Accumulates adjacent slices of one source view into parts.
class PartCollector
{
public:
    PartCollector(std::u32string_view source, std::vector<std::u32string_view>& parts)
        : source_(source)
        , parts_(parts)
    {
    }

    std::size_t size() const { return length_; }

    void append(std::u32string_view slice)
    {
        if (length_ == 0)
            start_ = static_cast<std::size_t>(slice.data() - source_.data());
        length_ += slice.size();
    }

    void flush()
    {
        if (length_ > 0)
            parts_.push_back(source_.substr(start_, length_));
        length_ = 0;
    }

private:
    std::u32string_view source_;
    std::vector<std::u32string_view>& parts_;
    std::size_t start_ = 0;
    std::size_t length_ = 0;
};

void emit_text_segments(std::u32string_view block, int limit, std::vector<Segment>& segments)
{
    for (auto part : enforce_max_chars(block, limit))
    {
        Segment segment;
        segment.content = utf32ToUtf8(part);
        segment.translate = true;
        segment.kind = SegmentKind::Text;
        segments.push_back(std::move(segment));
    }
}

void split_markdown_body(std::u32string_view body, const SegmentOptions& options, std::vector<Segment>& segments)
{
    const auto body_length = static_cast<long long>(body.size());
    int limit = options.max_chars;
    if (options.split_threshold && *options.split_threshold > 0 && body_length <= *options.split_threshold)
        limit = static_cast<int>(std::max<long long>(options.max_chars, body_length));

    const auto lines = split_lines_keep_ends(body);

    // Pending text lines are always adjacent in body, so a start/length pair describes them.
    std::size_t buffer_start = 0;
    std::size_t buffer_length = 0;
    auto flush_buffer = [&]()
    {
        if (buffer_length == 0)
            return;
        emit_text_segments(body.substr(buffer_start, buffer_length), limit, segments);
        buffer_length = 0;
    };

    std::size_t offset = 0;
    std::size_t idx = 0;
    while (idx < lines.size())
    {
        const auto line = lines[idx];
        const auto fence = options.preserve_code ? fence_marker(line) : std::u32string_view{};
        if (!fence.empty())
        {
            flush_buffer();
            const std::size_t block_start = offset;
            std::size_t block_length = line.size();
            ++idx;
            while (idx < lines.size())
            {
                const auto code_line = lines[idx];
                block_length += code_line.size();
                ++idx;
                if (lstripView(code_line).starts_with(fence))
                    break;
            }

            Segment code;
            code.content = utf32ToUtf8(body.substr(block_start, block_length));
            code.translate = false;
            code.kind = SegmentKind::Code;
            segments.push_back(std::move(code));
            offset = block_start + block_length;
            continue;
        }

        if (buffer_length == 0)
            buffer_start = offset;
        buffer_length += line.size();
        offset += line.size();
        ++idx;
    }

    flush_buffer();
}

} // namespace

std::size_t front_matter_length(std::u32string_view text)
{
    if (!text.starts_with(kFrontMatterDelimiter))
        return 0;

    const auto lines = split_lines_keep_ends(text);
    std::size_t consumed = lines.front().size();
    for (std::size_t i = 1; i < lines.size(); ++i)
    {
        consumed += lines[i].size();
        if (stripView(lines[i]).starts_with(kFrontMatterDelimiter))
            return consumed;
    }
    return 0;
}

std::vector<std::u32string_view> split_paragraphs(std::u32string_view text)
{
    std::vector<std::u32string_view> tokens;
    std::size_t token_start = 0;
    std::size_t i = 0;
    while (i < text.size())
    {
        if (text[i] != U'\n')
        {
            ++i;
            continue;
        }

        // A separator spans from this newline to the last newline of the following whitespace run.
        std::size_t j = i + 1;
        std::size_t last_newline = std::u32string_view::npos;
        while (j < text.size() && isSpaceChar(text[j]))
        {
            if (text[j] == U'\n')
                last_newline = j;
            ++j;
        }

        if (last_newline == std::u32string_view::npos)
        {
            i = j;
            continue;
        }

        if (i > token_start)
            tokens.push_back(text.substr(token_start, i - token_start));
        tokens.push_back(text.substr(i, last_newline + 1 - i));
        token_start = last_newline + 1;
        i = token_start;
    }

    if (token_start < text.size())
        tokens.push_back(text.substr(token_start));
    return tokens;
}

std::vector<std::u32string_view> split_sentences(std::u32string_view text)
{
    std::vector<std::u32string_view> sentences;
    const std::size_t n = text.size();
    std::size_t start = 0;
    while (start < n)
    {
        std::size_t end = n;
        // A sentence holds at least one character before its terminator.
        for (std::size_t k = start + 1; k <= n; ++k)
        {
            if (k < n && is_sentence_terminator(text[k]))
            {
                if (k + 1 < n && isSpaceChar(text[k + 1]))
                {
                    end = k + 2;
                    break;
                }
                if (at_text_end(text, k + 1))
                {
                    end = k + 1;
                    break;
                }
            }
            if (at_text_end(text, k))
            {
                end = k;
                break;
            }
        }
        sentences.push_back(text.substr(start, end - start));
        start = end;
    }
    return sentences;
}

std::vector<std::u32string_view> enforce_max_chars(std::u32string_view text, int limit)
{
    if (limit <= 0 || text.size() <= static_cast<std::size_t>(limit))
        return { text };

    const auto max_len = static_cast<std::size_t>(limit);
    std::vector<std::u32string_view> parts;
    PartCollector current(text, parts);

    for (auto token : split_paragraphs(text))
    {
        if (token.size() > max_len)
        {
            current.flush();
            for (auto sentence : split_sentences(token))
            {
                if (sentence.size() > max_len)
                {
                    current.flush();
                    for (std::size_t off = 0; off < sentence.size(); off += max_len)
                        parts.push_back(sentence.substr(off, max_len));
                    continue;
                }
                if (current.size() + sentence.size() > max_len)
                    current.flush();
                current.append(sentence);
            }
            current.flush();
            continue;
        }

        if (current.size() + token.size() > max_len)
            current.flush();
        current.append(token);
    }

    current.flush();
    return parts;
}

bool segment_document(const std::string& text, const SegmentOptions& options, SegmentedDocument& out,
                      std::string& out_error)
{
    out.segments.clear();

    if (options.strategy != "markdown")
    {
        out_error = "Unsupported segmentation strategy: " + options.strategy;
        return false;
    }
    if (!isValidUtf8(text))
    {
        out_error = "Document is not valid UTF-8";
        return false;
    }

    const std::u32string wide = utf8ToUtf32(text);
    std::u32string_view remaining = wide;

    if (options.preserve_frontmatter)
    {
        const std::size_t front_length = front_matter_length(remaining);
        if (front_length > 0)
        {
            Segment front;
            front.content = utf32ToUtf8(remaining.substr(0, front_length));
            front.translate = false;
            front.kind = SegmentKind::FrontMatter;
            out.segments.push_back(std::move(front));
            remaining.remove_prefix(front_length);
        }
    }

    split_markdown_body(remaining, options, out.segments);

    for (std::size_t i = 0; i < out.segments.size(); ++i)
        out.segments[i].index = i;
    return true;
}

} // namespace processing
