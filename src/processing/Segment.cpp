#include "Segment.hpp"
#include "TextUtils.hpp"

namespace processing
{

bool Segment::needsTranslation() const
{
    return translate && !isBlank(content);
}

std::string SegmentedDocument::merge() const
{
    std::size_t total = 0;
    for (const auto& segment : segments)
        total += segment.output().size();

    std::string merged;
    merged.reserve(total);
    for (const auto& segment : segments)
        merged += segment.output();
    return merged;
}

std::size_t SegmentedDocument::translatableCount() const
{
    std::size_t count = 0;
    for (const auto& segment : segments)
    {
        if (segment.needsTranslation())
            ++count;
    }
    return count;
}

} // namespace processing
