#pragma once

#include <functional>
#include <mutex>
#include <random>

namespace translate
{

// Exponential backoff with additive jitter. The delay before attempt n+1 is
// min(max_delay, base_delay * 2^(n-1)) plus a uniform jitter, raised to a
// server-provided Retry-After when that is larger.
class RetryPolicy
{
public:
    struct Options
    {
        int max_attempts = 3;
        double base_delay = 1.0;
        double max_delay = 30.0;
        double jitter_min = 0.1;
        double jitter_max = 0.5;
    };

    using SleepFn = std::function<void(double seconds)>;
    using JitterFn = std::function<double(double lo, double hi)>;

    RetryPolicy();
    explicit RetryPolicy(Options opts);

    const Options& options() const { return opts_; }
    int maxAttempts() const { return opts_.max_attempts; }

    // `attempt` is the 1-based number of the attempt that just failed.
    double delayFor(int attempt, double retry_after_seconds = 0.0) const;

    void sleep(double seconds) const;

    // Tests replace both to run without waiting.
    void setSleepFunction(SleepFn fn) { sleep_fn_ = std::move(fn); }
    void setJitterFunction(JitterFn fn) { jitter_fn_ = std::move(fn); }

private:
    double jitter(double lo, double hi) const;

    Options opts_;
    SleepFn sleep_fn_;
    JitterFn jitter_fn_;
    mutable std::mutex rng_mutex_;
    mutable std::mt19937 rng_;
};

} // namespace translate
