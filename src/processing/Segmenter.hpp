#pragma once

#include "Segment.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace processing
{

struct SegmentOptions
{
    std::string strategy = "markdown";
    int max_chars = 4000;
    bool preserve_code = true;
    bool preserve_frontmatter = true;
    // Documents at or below this many code points are kept whole.
    std::optional<int> split_threshold;
};

/// Splits a document into ordered segments. Concatenating every segment's
/// content reproduces text exactly. Fails only for an unknown strategy or
/// input that is not UTF-8.
bool segment_document(const std::string& text, const SegmentOptions& options, SegmentedDocument& out,
                      std::string& out_error);

/// Length in code points of a leading "---" block closed by a later "---" line; 0 when absent.
std::size_t front_matter_length(std::u32string_view text);

/// Blank-line separated tokens; separators are kept as their own tokens.
std::vector<std::u32string_view> split_paragraphs(std::u32string_view text);

/// Sentences end at . ! ? 。 ！ ？ ； ; followed by whitespace (kept) or end of text.
std::vector<std::u32string_view> split_sentences(std::u32string_view text);

/// Paragraphs, then sentences, then hard wraps; every part is at most limit code points.
/// A limit <= 0 returns the text unchanged.
std::vector<std::u32string_view> enforce_max_chars(std::u32string_view text, int limit);

} // namespace processing
