#include "ProgressReporter.hpp"

#include <plog/Log.h>

#include <iomanip>
#include <sstream>

namespace app
{

void ProgressReporter::addTotal(std::size_t count)
{
    total_.fetch_add(count, std::memory_order_relaxed);
}

void ProgressReporter::onProgress(std::size_t count)
{
    if (count == 0)
        return;
    completed_.fetch_add(count, std::memory_order_relaxed);
    report();
}

void ProgressReporter::onRetry(int attempt, const std::string& error, double delay_seconds)
{
    std::ostringstream msg;
    msg << "Retry attempt " << attempt << " after error: " << error << ". Waiting " << std::fixed
        << std::setprecision(1) << delay_seconds << "s";
    PLOG_WARNING << msg.str();
}

void ProgressReporter::report()
{
    const std::size_t total = total_.load(std::memory_order_relaxed);
    const std::size_t done = completed_.load(std::memory_order_relaxed);
    if (total == 0)
        return;

    // Pass-through segments are reported too, so done may run ahead of total.
    const std::size_t shown = done > total ? total : done;
    const int step = static_cast<int>(shown * 10 / total);

    std::lock_guard<std::mutex> lk(report_mutex_);
    if (step <= last_step_)
        return;
    last_step_ = step;
    PLOG_INFO << "Translating: " << shown << "/" << total << " segments (" << step * 10 << "%)";
}

} // namespace app
