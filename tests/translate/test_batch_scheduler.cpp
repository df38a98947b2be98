#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "cache/CacheKey.hpp"
#include "cache/TranslationCache.hpp"
#include "translate/BatchScheduler.hpp"
#include "../utils/mock_translator.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

using namespace translate;
using Catch::Matchers::WithinAbs;
using test_utils::MockTranslator;

namespace {

std::vector<processing::Segment> make_segments(const std::vector<std::string>& texts) {
    std::vector<processing::Segment> segments;
    for (std::size_t i = 0; i < texts.size(); ++i) {
        processing::Segment seg;
        seg.index = i;
        seg.content = texts[i];
        segments.push_back(seg);
    }
    return segments;
}

SchedulerOptions options(std::size_t concurrency = 4, std::size_t pending = 0) {
    SchedulerOptions opts;
    opts.target_lang = "fr";
    opts.model = "test-model";
    opts.concurrency = concurrency;
    opts.max_pending_batches = pending;
    return opts;
}

void no_wait(BatchScheduler& scheduler, std::vector<double>* sleeps = nullptr) {
    scheduler.retryPolicy().setJitterFunction([](double lo, double) { return lo; });
    scheduler.retryPolicy().setSleepFunction([sleeps](double seconds) {
        if (sleeps)
            sleeps->push_back(seconds);
    });
}

class CountingProgress : public IProgressObserver {
public:
    void onProgress(std::size_t count) override { total += count; }
    std::atomic<std::size_t> total{0};
};

class RecordingRetry : public IRetryObserver {
public:
    void onRetry(int attempt, const std::string& error, double delay_seconds) override {
        std::lock_guard<std::mutex> lk(mutex);
        attempts.push_back(attempt);
        errors.push_back(error);
        delays.push_back(delay_seconds);
    }
    std::mutex mutex;
    std::vector<int> attempts;
    std::vector<std::string> errors;
    std::vector<double> delays;
};

class RecordingSegments : public ISegmentObserver {
public:
    void onSegmentReady(const processing::Segment& segment) override {
        std::lock_guard<std::mutex> lk(mutex);
        indices.push_back(segment.index);
    }
    std::mutex mutex;
    std::vector<std::size_t> indices;
};

}  // namespace

TEST_CASE("Batch scheduler translates every segment", "[translate][scheduler]") {
    MockTranslator translator;
    BatchScheduler scheduler(translator, options());
    auto segments = make_segments({"One.\n", "Two.\n", "Three.\n"});

    CountingProgress progress;
    RecordingSegments ready;
    Observers observers;
    observers.progress = &progress;
    observers.segment = &ready;

    auto result = scheduler.translate(segments, observers);
    REQUIRE(result.success);
    for (const auto& seg : segments)
        REQUIRE(seg.translation == MockTranslator::translated(seg.content));

    const auto stats = scheduler.stats().snapshot();
    REQUIRE(stats.total_segments == 3);
    REQUIRE(stats.batches == 1);
    REQUIRE(stats.api_calls == 1);
    REQUIRE(stats.retries == 0);
    REQUIRE(progress.total.load() == 3);
    REQUIRE(ready.indices.size() == 3);
    REQUIRE(translator.lastTarget() == "fr");
}

TEST_CASE("Pass-through segments never reach the service", "[translate][scheduler]") {
    MockTranslator translator;
    BatchScheduler scheduler(translator, options());
    auto segments = make_segments({"```\ncode\n```\n", "\n\n", "Text.\n"});
    segments[0].translate = false;
    segments[0].kind = processing::SegmentKind::Code;

    CountingProgress progress;
    Observers observers;
    observers.progress = &progress;
    REQUIRE(scheduler.translate(segments, observers).success);

    REQUIRE(segments[0].translation == segments[0].content);
    REQUIRE(segments[1].translation == "\n\n");
    REQUIRE(segments[2].translation == "[fr] Text.\n");
    REQUIRE(translator.callCount() == 1);
    REQUIRE(translator.calls().front() == std::vector<std::string>{"Text.\n"});
    REQUIRE(scheduler.stats().snapshot().total_segments == 1);
    REQUIRE(progress.total.load() == 3);
}

TEST_CASE("Batches respect segment and character limits", "[translate][scheduler]") {
    MockTranslator translator;

    SECTION("Segment count") {
        auto opts = options();
        opts.max_batch_segments = 2;
        BatchScheduler scheduler(translator, opts);
        auto segments = make_segments({"a", "b", "c", "d", "e"});
        REQUIRE(scheduler.translate(segments).success);
        REQUIRE(scheduler.stats().snapshot().batches == 3);
        for (const auto& call : translator.calls())
            REQUIRE(call.size() <= 2);
    }

    SECTION("Character budget") {
        auto opts = options();
        opts.max_batch_chars = 10;
        BatchScheduler scheduler(translator, opts);
        auto segments = make_segments({"abcdef", "ghijkl", "mn", "opqrstuvwxyz"});
        REQUIRE(scheduler.translate(segments).success);

        // "abcdef" | "ghijkl" + "mn" | oversized segment alone
        REQUIRE(scheduler.stats().snapshot().batches == 3);
        for (const auto& seg : segments)
            REQUIRE(seg.translation == MockTranslator::translated(seg.content));
    }
}

TEST_CASE("Count mismatch falls back to single requests", "[translate][scheduler]") {
    MockTranslator translator;
    translator.setHandler([](const std::vector<std::string>& texts) {
        if (texts.size() > 1) {
            BatchResult r;
            r.status = BatchStatus::CountMismatch;
            r.translations = {"only one"};
            r.expected = texts.size();
            r.received = 1;
            r.usage.prompt_tokens = 5;
            r.usage.completion_tokens = 7;
            return r;
        }
        auto r = MockTranslator::ok({"single:" + texts.front()});
        r.usage.prompt_tokens = 1;
        r.usage.completion_tokens = 2;
        return r;
    });

    BatchScheduler scheduler(translator, options());
    no_wait(scheduler);
    const std::vector<std::string> texts = {"Alpha.", "Beta.", "Gamma.", "Delta."};
    auto segments = make_segments(texts);

    REQUIRE(scheduler.translate(segments).success);
    for (const auto& seg : segments)
        REQUIRE(seg.translation == "single:" + seg.content);

    const auto n = texts.size();
    const auto stats = scheduler.stats().snapshot();
    REQUIRE(stats.batches == 1);
    REQUIRE(stats.api_calls == 1 + n);
    REQUIRE(stats.retries == 0);
    REQUIRE(stats.prompt_tokens == 5 + n);
    REQUIRE(stats.completion_tokens == 7 + 2 * n);

    // one batch call followed by one call per segment
    const auto calls = translator.calls();
    REQUIRE(calls.size() == 1 + n);
    REQUIRE(calls.front().size() == n);
    for (std::size_t i = 1; i < calls.size(); ++i)
        REQUIRE(calls[i].size() == 1);
}

TEST_CASE("A blank slot in a batch reply falls back to single requests", "[translate][scheduler][cache]") {
    MockTranslator translator;
    translator.setHandler([](const std::vector<std::string>& texts) {
        auto r = MockTranslator::prefixAll(texts);
        if (texts.size() > 1)
            r.translations[1] = "\n";
        return r;
    });

    cache::TranslationCache store;
    const auto opts = options();
    BatchScheduler scheduler(translator, opts, &store);
    no_wait(scheduler);
    auto segments = make_segments({"Alfa.", "Beta.", "Gama."});

    REQUIRE(scheduler.translate(segments).success);
    for (const auto& seg : segments)
        REQUIRE(seg.translation == MockTranslator::translated(seg.content));

    const auto calls = translator.calls();
    REQUIRE(calls.size() == 4);
    REQUIRE(calls.front().size() == 3);

    for (const std::string source : {"Alfa.", "Beta.", "Gama."}) {
        const auto key = cache::CacheKey::make(source, opts.target_lang, opts.model, opts.source_lang);
        const auto cached = store.get(key.fingerprint());
        REQUIRE(cached.has_value());
        REQUIRE(*cached == MockTranslator::translated(source));
    }
}

TEST_CASE("A blank single translation is retried", "[translate][scheduler]") {
    MockTranslator translator;
    std::atomic<int> attempts{0};
    translator.setHandler([&attempts](const std::vector<std::string>& texts) {
        if (++attempts == 1)
            return MockTranslator::ok({"   "});
        return MockTranslator::prefixAll(texts);
    });

    cache::TranslationCache store;
    BatchScheduler scheduler(translator, options(), &store);
    RecordingRetry retries;
    no_wait(scheduler);
    auto segments = make_segments({"Lonely."});

    Observers observers;
    observers.retry = &retries;
    REQUIRE(scheduler.translate(segments, observers).success);
    REQUIRE(segments[0].translation == "[fr] Lonely.");
    REQUIRE(attempts == 2);
    REQUIRE(retries.errors == std::vector<std::string>{"received an empty translation"});
    REQUIRE(scheduler.stats().snapshot().retries == 1);
}

TEST_CASE("Transient failures are retried with backoff", "[translate][scheduler]") {
    MockTranslator translator;
    std::atomic<int> attempts{0};

    SECTION("Recovers before the attempt budget runs out") {
        translator.setHandler([&attempts](const std::vector<std::string>& texts) {
            if (++attempts < 3)
                return MockTranslator::failure("HTTP 503: upstream overloaded", true);
            return MockTranslator::prefixAll(texts);
        });

        BatchScheduler scheduler(translator, options());
        std::vector<double> sleeps;
        no_wait(scheduler, &sleeps);
        RecordingRetry retry;
        Observers observers;
        observers.retry = &retry;

        auto segments = make_segments({"Hello."});
        REQUIRE(scheduler.translate(segments, observers).success);
        REQUIRE(segments[0].translation == "[fr] Hello.");

        REQUIRE(retry.attempts == std::vector<int>{1, 2});
        REQUIRE(retry.errors.front() == "HTTP 503: upstream overloaded");
        REQUIRE_THAT(retry.delays[0], WithinAbs(1.1, 1e-9));
        REQUIRE_THAT(retry.delays[1], WithinAbs(2.1, 1e-9));
        REQUIRE(sleeps == retry.delays);

        const auto stats = scheduler.stats().snapshot();
        REQUIRE(stats.retries == 2);
        REQUIRE(stats.api_calls == 1);
    }

    SECTION("Retry-After raises the delay") {
        translator.setHandler([&attempts](const std::vector<std::string>& texts) {
            if (++attempts == 1) {
                auto r = MockTranslator::failure("HTTP 429: rate limited", true);
                r.retry_after_seconds = 5.0;
                return r;
            }
            return MockTranslator::prefixAll(texts);
        });

        BatchScheduler scheduler(translator, options());
        std::vector<double> sleeps;
        no_wait(scheduler, &sleeps);
        auto segments = make_segments({"Hello."});
        REQUIRE(scheduler.translate(segments).success);
        REQUIRE(sleeps == std::vector<double>{5.0});
    }

    SECTION("Exhausted attempts fail the document with the last error") {
        translator.setHandler([&attempts](const std::vector<std::string>&) {
            ++attempts;
            return MockTranslator::failure("Request timeout after 60000 ms", true);
        });

        BatchScheduler scheduler(translator, options());
        no_wait(scheduler);
        auto segments = make_segments({"Hello."});
        auto result = scheduler.translate(segments);

        REQUIRE_FALSE(result.success);
        REQUIRE(result.error_message.find("timeout") != std::string::npos);
        REQUIRE(attempts.load() == 3);
        REQUIRE(scheduler.stats().snapshot().retries == 2);
        REQUIRE_FALSE(segments[0].translation.has_value());
    }

    SECTION("Non-retryable errors fail immediately") {
        translator.setHandler([&attempts](const std::vector<std::string>&) {
            ++attempts;
            return MockTranslator::failure("HTTP 401: invalid api key", false);
        });

        BatchScheduler scheduler(translator, options());
        no_wait(scheduler);
        auto segments = make_segments({"Hello."});
        auto result = scheduler.translate(segments);

        REQUIRE_FALSE(result.success);
        REQUIRE(attempts.load() == 1);
        REQUIRE(result.error_message == "HTTP 401: invalid api key");
    }

    SECTION("Retry budget comes from the options") {
        translator.setHandler([&attempts](const std::vector<std::string>&) {
            ++attempts;
            return MockTranslator::failure("connection reset", true);
        });

        auto opts = options();
        opts.retry.max_attempts = 5;
        BatchScheduler scheduler(translator, opts);
        no_wait(scheduler);
        auto segments = make_segments({"Hello."});
        REQUIRE_FALSE(scheduler.translate(segments).success);
        REQUIRE(attempts.load() == 5);
    }
}

TEST_CASE("Pending batch limit applies backpressure", "[translate][scheduler]") {
    MockTranslator translator;
    translator.setHandler([](const std::vector<std::string>& texts) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        return MockTranslator::prefixAll(texts);
    });

    SECTION("One pending batch serializes requests") {
        auto opts = options(4, 1);
        opts.max_batch_segments = 1;
        BatchScheduler scheduler(translator, opts);
        auto segments = make_segments({"a", "b", "c", "d", "e"});

        REQUIRE(scheduler.translate(segments).success);
        REQUIRE(translator.maxInFlight() == 1);

        const auto calls = translator.calls();
        REQUIRE(calls.size() == 5);
        for (std::size_t i = 0; i < calls.size(); ++i)
            REQUIRE(calls[i].front() == segments[i].content);
    }

    SECTION("Request concurrency caps simultaneous calls") {
        auto opts = options(2, 8);
        opts.max_batch_segments = 1;
        BatchScheduler scheduler(translator, opts);
        auto segments = make_segments({"a", "b", "c", "d", "e", "f", "g", "h"});

        REQUIRE(scheduler.translate(segments).success);
        REQUIRE(translator.maxInFlight() <= 2);
        REQUIRE(scheduler.stats().snapshot().batches == 8);
    }
}

TEST_CASE("Concurrent documents share one scheduler", "[translate][scheduler]") {
    MockTranslator translator;
    auto opts = options(3, 2);
    opts.max_batch_segments = 2;
    BatchScheduler scheduler(translator, opts);

    std::vector<std::vector<processing::Segment>> documents;
    for (int d = 0; d < 4; ++d)
        documents.push_back(make_segments({"d" + std::to_string(d) + "a", "d" + std::to_string(d) + "b",
                                           "d" + std::to_string(d) + "c"}));

    std::vector<std::thread> workers;
    std::atomic<int> succeeded{0};
    for (auto& doc : documents) {
        workers.emplace_back([&scheduler, &doc, &succeeded]() {
            if (scheduler.translate(doc).success)
                ++succeeded;
        });
    }
    for (auto& w : workers)
        w.join();

    REQUIRE(succeeded.load() == 4);
    REQUIRE(translator.maxInFlight() <= 3);
    REQUIRE(scheduler.stats().snapshot().total_segments == 12);
    for (const auto& doc : documents)
        for (const auto& seg : doc)
            REQUIRE(seg.translation == MockTranslator::translated(seg.content));
}

TEST_CASE("Cached translations skip the service", "[translate][scheduler][cache]") {
    MockTranslator translator;
    cache::TranslationCache store;
    const auto opts = options();

    const auto key = cache::CacheKey::make("Known.", opts.target_lang, opts.model, opts.source_lang);
    store.set(key.fingerprint(), "Connu.", {key.content_hash, key.target_lang, key.model, key.source_lang});

    BatchScheduler scheduler(translator, opts, &store);
    auto segments = make_segments({"Known.", "Unknown."});
    REQUIRE(scheduler.translate(segments).success);

    REQUIRE(segments[0].translation == "Connu.");
    REQUIRE(segments[1].translation == "[fr] Unknown.");
    REQUIRE(translator.callCount() == 1);
    REQUIRE(translator.calls().front() == std::vector<std::string>{"Unknown."});

    auto stats = scheduler.stats().snapshot();
    REQUIRE(stats.cached_segments == 1);
    REQUIRE(stats.api_calls == 1);

    SECTION("New translations are stored for the next run") {
        auto again = make_segments({"Known.", "Unknown."});
        REQUIRE(scheduler.translate(again).success);
        REQUIRE(again[1].translation == "[fr] Unknown.");
        REQUIRE(translator.callCount() == 1);
        REQUIRE(scheduler.stats().snapshot().cached_segments == 3);
    }
}
