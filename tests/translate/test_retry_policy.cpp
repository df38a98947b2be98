#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "translate/RetryPolicy.hpp"

using translate::RetryPolicy;
using Catch::Matchers::WithinAbs;

TEST_CASE("Backoff doubles up to the cap", "[translate][retry]") {
    RetryPolicy policy;
    policy.setJitterFunction([](double, double) { return 0.0; });

    REQUIRE_THAT(policy.delayFor(1), WithinAbs(1.0, 1e-9));
    REQUIRE_THAT(policy.delayFor(2), WithinAbs(2.0, 1e-9));
    REQUIRE_THAT(policy.delayFor(3), WithinAbs(4.0, 1e-9));
    REQUIRE_THAT(policy.delayFor(6), WithinAbs(30.0, 1e-9));
    REQUIRE_THAT(policy.delayFor(20), WithinAbs(30.0, 1e-9));
}

TEST_CASE("Jitter is added after the cap", "[translate][retry]") {
    RetryPolicy policy;

    SECTION("Within the configured range") {
        for (int attempt = 1; attempt <= 8; ++attempt) {
            const double capped = attempt >= 6 ? 30.0 : static_cast<double>(1 << (attempt - 1));
            const double delay = policy.delayFor(attempt);
            REQUIRE(delay >= capped + 0.1);
            REQUIRE(delay <= capped + 0.5);
        }
    }

    SECTION("Retry-After wins when longer") {
        policy.setJitterFunction([](double lo, double) { return lo; });
        REQUIRE_THAT(policy.delayFor(1, 12.0), WithinAbs(12.0, 1e-9));
        REQUIRE_THAT(policy.delayFor(1, 0.5), WithinAbs(1.1, 1e-9));
    }
}

TEST_CASE("Retry options are sanitized", "[translate][retry]") {
    RetryPolicy::Options opts;
    opts.max_attempts = 0;
    opts.jitter_min = 0.5;
    opts.jitter_max = 0.1;
    RetryPolicy policy(opts);

    REQUIRE(policy.maxAttempts() == 1);
    REQUIRE(policy.options().jitter_min == 0.1);
    REQUIRE(policy.options().jitter_max == 0.5);
}

TEST_CASE("Sleeping goes through the injected function", "[translate][retry]") {
    RetryPolicy policy;
    double slept = -1.0;
    policy.setSleepFunction([&slept](double seconds) { slept = seconds; });

    policy.sleep(2.5);
    REQUIRE(slept == 2.5);

    slept = -1.0;
    policy.sleep(0.0);
    REQUIRE(slept == -1.0);
}
