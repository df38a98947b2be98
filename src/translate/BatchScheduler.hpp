#pragma once

#include "ITranslator.hpp"
#include "RetryPolicy.hpp"
#include "TranslationObservers.hpp"
#include "TranslatorStats.hpp"
#include "../processing/Segment.hpp"
#include "../utils/Semaphore.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace cache
{
class ITranslationCache;
}

namespace translate
{

struct SchedulerOptions
{
    std::string target_lang;
    std::string source_lang = "auto";
    // Part of the cache fingerprint only; the translator carries its own model.
    std::string model;
    std::size_t concurrency = 4;
    // 0 selects 2 * concurrency.
    std::size_t max_pending_batches = 0;
    std::size_t max_batch_chars = 16000;
    std::size_t max_batch_segments = 6;
    RetryPolicy::Options retry;
};

struct RunResult
{
    bool success = true;
    std::string error_message;
};

/// Resolves every segment's translation in place.
///
/// Translatable segments are packed into batches in document order and run on a
/// worker pool. Two limits apply: a per-call pending-batch limit taken by the
/// producer before a batch is queued, and a request limit shared by all calls
/// that wraps each network round trip. A count mismatch splits the batch into
/// single requests; any other failure is retried with backoff. The first
/// terminal failure stops the remaining batches of that call.
///
/// translate() may run concurrently from several document workers.
class BatchScheduler
{
public:
    BatchScheduler(ITranslator& translator, SchedulerOptions opts, cache::ITranslationCache* cache = nullptr);

    RunResult translate(std::vector<processing::Segment>& segments, const Observers& observers = {});

    const TranslatorStats& stats() const { return stats_; }
    const SchedulerOptions& options() const { return opts_; }
    RetryPolicy& retryPolicy() { return retry_; }

private:
    struct Batch
    {
        std::vector<std::size_t> indices;
        std::size_t chars = 0;
    };

    struct CallState;

    enum class Outcome
    {
        Success,
        Mismatch,
        Failed
    };

    void runBatch(CallState& st, const Batch& batch);
    bool translateSingle(CallState& st, std::size_t index);
    Outcome request(CallState& st, const std::vector<std::string>& texts, BatchResult& out);
    void resolve(CallState& st, std::size_t index, std::string translation, bool store);
    void fail(CallState& st, const std::string& error);

    ITranslator& translator_;
    SchedulerOptions opts_;
    cache::ITranslationCache* cache_;
    RetryPolicy retry_;
    TranslatorStats stats_;
    utils::Semaphore requests_;
};

} // namespace translate
