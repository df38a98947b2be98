#pragma once

#include "../translate/TranslationObservers.hpp"

#include <atomic>
#include <cstddef>
#include <mutex>

namespace app
{

// Segment progress for the whole run. The total grows while the reader is still
// segmenting files, so percentages are recomputed on every update and a line is
// logged each time another 10% step is crossed.
class ProgressReporter : public translate::IProgressObserver, public translate::IRetryObserver
{
public:
    void addTotal(std::size_t count);

    void onProgress(std::size_t count) override;
    void onRetry(int attempt, const std::string& error, double delay_seconds) override;

    std::size_t completed() const { return completed_.load(std::memory_order_relaxed); }
    std::size_t total() const { return total_.load(std::memory_order_relaxed); }

private:
    void report();

    std::atomic<std::size_t> total_{ 0 };
    std::atomic<std::size_t> completed_{ 0 };
    std::mutex report_mutex_;
    int last_step_ = 0;
};

} // namespace app
