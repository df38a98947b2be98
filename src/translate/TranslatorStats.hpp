#pragma once

#include <atomic>
#include <cstdint>

namespace translate
{

// Run-wide counters. Written by scheduler worker threads, read through snapshot().
struct TranslatorStats
{
    struct Snapshot
    {
        std::uint64_t total_segments = 0;
        std::uint64_t cached_segments = 0;
        std::uint64_t api_calls = 0;
        std::uint64_t batches = 0;
        std::uint64_t retries = 0;
        std::uint64_t prompt_tokens = 0;
        std::uint64_t completion_tokens = 0;
    };

    std::atomic<std::uint64_t> total_segments{ 0 };
    std::atomic<std::uint64_t> cached_segments{ 0 };
    std::atomic<std::uint64_t> api_calls{ 0 };
    std::atomic<std::uint64_t> batches{ 0 };
    std::atomic<std::uint64_t> retries{ 0 };
    std::atomic<std::uint64_t> prompt_tokens{ 0 };
    std::atomic<std::uint64_t> completion_tokens{ 0 };

    Snapshot snapshot() const
    {
        Snapshot s;
        s.total_segments = total_segments.load(std::memory_order_relaxed);
        s.cached_segments = cached_segments.load(std::memory_order_relaxed);
        s.api_calls = api_calls.load(std::memory_order_relaxed);
        s.batches = batches.load(std::memory_order_relaxed);
        s.retries = retries.load(std::memory_order_relaxed);
        s.prompt_tokens = prompt_tokens.load(std::memory_order_relaxed);
        s.completion_tokens = completion_tokens.load(std::memory_order_relaxed);
        return s;
    }
};

} // namespace translate
