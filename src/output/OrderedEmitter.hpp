#pragma once

#include "../processing/Segment.hpp"
#include "../translate/TranslationObservers.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace output
{

/// Releases a document as a sequence of contiguous prefixes.
///
/// Segments may resolve in any order. Each resolution marks its index; whenever
/// the lowest unemitted index is resolved, every consecutive resolved segment from
/// there is concatenated and passed to the handler. The handler runs under the
/// emitter's lock, so chunks reach it in document order.
class OrderedEmitter : public translate::ISegmentObserver
{
public:
    using ChunkHandler = std::function<void(const std::string& chunk)>;

    OrderedEmitter(const processing::SegmentedDocument& document, ChunkHandler handler);

    void onSegmentReady(const processing::Segment& segment) override;

    bool complete() const;
    std::size_t chunksEmitted() const;
    std::size_t nextIndex() const;

private:
    const processing::SegmentedDocument& document_;
    ChunkHandler handler_;
    mutable std::mutex mutex_;
    std::vector<bool> ready_;
    std::size_t next_ = 0;
    std::size_t chunks_ = 0;
};

} // namespace output
