#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace processing
{

enum class SegmentKind
{
    Text,
    Code,
    FrontMatter
};

/// One slice of a source document. Indexes are dense and follow document order.
struct Segment
{
    std::size_t index = 0;
    std::string content;
    bool translate = true;
    SegmentKind kind = SegmentKind::Text;
    // Written once by whichever path resolves the segment.
    std::optional<std::string> translation;

    const std::string& output() const { return translation ? *translation : content; }

    bool resolved() const { return translation.has_value(); }

    /// Translatable segments with only whitespace are copied through untouched.
    bool needsTranslation() const;
};

struct SegmentedDocument
{
    std::vector<Segment> segments;

    std::string merge() const;

    std::size_t translatableCount() const;

    bool empty() const { return segments.empty(); }
    std::size_t size() const { return segments.size(); }
};

} // namespace processing
