#pragma once

#include <cstddef>
#include <string>

namespace processing
{
struct Segment;
}

namespace translate
{

// Observers may be called from several scheduler threads at once.

class IProgressObserver
{
public:
    virtual ~IProgressObserver() = default;
    virtual void onProgress(std::size_t count) { (void)count; }
};

class IRetryObserver
{
public:
    virtual ~IRetryObserver() = default;
    virtual void onRetry(int attempt, const std::string& error, double delay_seconds)
    {
        (void)attempt;
        (void)error;
        (void)delay_seconds;
    }
};

class ISegmentObserver
{
public:
    virtual ~ISegmentObserver() = default;
    virtual void onSegmentReady(const processing::Segment& segment) { (void)segment; }
};

struct Observers
{
    IProgressObserver* progress = nullptr;
    IRetryObserver* retry = nullptr;
    ISegmentObserver* segment = nullptr;
};

} // namespace translate
