#include "RetryPolicy.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <thread>

namespace translate
{

RetryPolicy::RetryPolicy()
    : RetryPolicy(Options{})
{
}

RetryPolicy::RetryPolicy(Options opts)
    : opts_(opts)
    , rng_(std::random_device{}())
{
    if (opts_.max_attempts < 1)
        opts_.max_attempts = 1;
    if (opts_.jitter_max < opts_.jitter_min)
        std::swap(opts_.jitter_min, opts_.jitter_max);
}

double RetryPolicy::delayFor(int attempt, double retry_after_seconds) const
{
    const int exponent = std::max(0, attempt - 1);
    double delay = std::min(opts_.max_delay, opts_.base_delay * std::pow(2.0, exponent));
    delay += jitter(opts_.jitter_min, opts_.jitter_max);
    return std::max(delay, retry_after_seconds);
}

void RetryPolicy::sleep(double seconds) const
{
    if (seconds <= 0.0)
        return;
    if (sleep_fn_)
    {
        sleep_fn_(seconds);
        return;
    }
    std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
}

double RetryPolicy::jitter(double lo, double hi) const
{
    if (jitter_fn_)
        return jitter_fn_(lo, hi);
    if (hi <= lo)
        return lo;
    std::lock_guard<std::mutex> lk(rng_mutex_);
    std::uniform_real_distribution<double> dist(lo, hi);
    return dist(rng_);
}

} // namespace translate
