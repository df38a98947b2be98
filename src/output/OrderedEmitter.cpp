#include "OrderedEmitter.hpp"

#include <plog/Log.h>

namespace output
{

OrderedEmitter::OrderedEmitter(const processing::SegmentedDocument& document, ChunkHandler handler)
    : document_(document)
    , handler_(std::move(handler))
    , ready_(document.segments.size(), false)
{
}

void OrderedEmitter::onSegmentReady(const processing::Segment& segment)
{
    std::lock_guard<std::mutex> lk(mutex_);
    if (segment.index >= ready_.size())
    {
        PLOG_WARNING << "OrderedEmitter: segment index " << segment.index << " out of range";
        return;
    }
    if (ready_[segment.index])
        return;
    ready_[segment.index] = true;

    std::string chunk;
    while (next_ < ready_.size() && ready_[next_])
    {
        chunk += document_.segments[next_].output();
        ++next_;
    }

    if (chunk.empty())
        return;
    ++chunks_;
    if (handler_)
        handler_(chunk);
}

bool OrderedEmitter::complete() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return next_ == ready_.size();
}

std::size_t OrderedEmitter::chunksEmitted() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return chunks_;
}

std::size_t OrderedEmitter::nextIndex() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return next_;
}

} // namespace output
