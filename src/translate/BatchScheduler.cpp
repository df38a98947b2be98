#include "BatchScheduler.hpp"
#include "../cache/CacheKey.hpp"
#include "../cache/ITranslationCache.hpp"
#include "../processing/TextUtils.hpp"
#include "../utils/ErrorReporter.hpp"

#include <BS_thread_pool.hpp>
#include <plog/Log.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>

namespace translate
{

namespace
{

IProgressObserver s_no_progress;
IRetryObserver s_no_retry;
ISegmentObserver s_no_segment;

bool has_blank_translation(const std::vector<std::string>& translations)
{
    for (const auto& t : translations)
    {
        if (processing::isBlank(t))
            return true;
    }
    return false;
}

} // namespace

struct BatchScheduler::CallState
{
    CallState(std::vector<processing::Segment>& segs, const Observers& obs, std::size_t pending_slots)
        : segments(segs)
        , progress(obs.progress ? obs.progress : &s_no_progress)
        , retry(obs.retry ? obs.retry : &s_no_retry)
        , segment(obs.segment ? obs.segment : &s_no_segment)
        , keys(segs.size())
        , pending(pending_slots)
    {
    }

    std::vector<processing::Segment>& segments;
    IProgressObserver* progress;
    IRetryObserver* retry;
    ISegmentObserver* segment;
    std::vector<std::optional<cache::CacheKey>> keys;
    utils::Semaphore pending;
    std::atomic<bool> failed{ false };
    std::mutex error_mutex;
    std::string error;
};

BatchScheduler::BatchScheduler(ITranslator& translator, SchedulerOptions opts, cache::ITranslationCache* cache)
    : translator_(translator)
    , opts_(std::move(opts))
    , cache_(cache)
    , retry_(opts_.retry)
    , requests_(opts_.concurrency == 0 ? 1 : opts_.concurrency)
{
    if (opts_.concurrency == 0)
        opts_.concurrency = 1;
    if (opts_.max_pending_batches == 0)
        opts_.max_pending_batches = opts_.concurrency * 2;
    if (opts_.max_batch_segments == 0)
        opts_.max_batch_segments = 1;
}

RunResult BatchScheduler::translate(std::vector<processing::Segment>& segments, const Observers& observers)
{
    CallState st(segments, observers, opts_.max_pending_batches);
    std::unique_ptr<BS::light_thread_pool> pool;

    auto dispatch = [&](Batch& batch) {
        if (batch.indices.empty())
            return;
        // Blocks while max_pending_batches batches of this call are unresolved.
        st.pending.acquire();
        if (st.failed.load())
        {
            st.pending.release();
            batch = Batch{};
            return;
        }
        if (!pool)
            pool = std::make_unique<BS::light_thread_pool>(opts_.max_pending_batches);
        pool->detach_task([this, &st, work = std::move(batch)]() {
            utils::Semaphore::Guard slot(st.pending, std::adopt_lock);
            runBatch(st, work);
        });
        batch = Batch{};
    };

    Batch current;
    for (std::size_t i = 0; i < segments.size(); ++i)
    {
        if (st.failed.load())
            break;

        auto& seg = segments[i];
        if (!seg.needsTranslation())
        {
            resolve(st, i, seg.content, false);
            continue;
        }

        stats_.total_segments.fetch_add(1, std::memory_order_relaxed);

        if (cache_)
        {
            st.keys[i] = cache::CacheKey::make(seg.content, opts_.target_lang, opts_.model, opts_.source_lang);
            if (auto hit = cache_->get(st.keys[i]->fingerprint()))
            {
                stats_.cached_segments.fetch_add(1, std::memory_order_relaxed);
                resolve(st, i, std::move(*hit), false);
                continue;
            }
        }

        const std::size_t len = processing::codepointLength(seg.content);
        if (!current.indices.empty() &&
            (current.indices.size() + 1 > opts_.max_batch_segments || current.chars + len > opts_.max_batch_chars))
        {
            dispatch(current);
        }
        current.indices.push_back(i);
        current.chars += len;
    }
    if (!st.failed.load())
        dispatch(current);

    if (pool)
        pool->wait();

    RunResult result;
    result.success = !st.failed.load();
    if (!result.success)
    {
        std::lock_guard<std::mutex> lk(st.error_mutex);
        result.error_message = st.error;
    }
    return result;
}

void BatchScheduler::runBatch(CallState& st, const Batch& batch)
{
    if (st.failed.load())
        return;

    try
    {
        if (batch.indices.size() == 1)
        {
            stats_.batches.fetch_add(1, std::memory_order_relaxed);
            translateSingle(st, batch.indices.front());
            return;
        }

        std::vector<std::string> texts;
        texts.reserve(batch.indices.size());
        for (auto idx : batch.indices)
            texts.push_back(st.segments[idx].content);

        stats_.batches.fetch_add(1, std::memory_order_relaxed);
        BatchResult res;
        switch (request(st, texts, res))
        {
        case Outcome::Success:
            for (std::size_t k = 0; k < batch.indices.size(); ++k)
                resolve(st, batch.indices[k], std::move(res.translations[k]), true);
            return;
        case Outcome::Mismatch:
            PLOG_WARNING << "Batch of " << texts.size() << " returned " << res.received
                         << " translations; falling back to single requests";
            for (auto idx : batch.indices)
            {
                if (!translateSingle(st, idx))
                    return;
            }
            return;
        case Outcome::Failed:
            return;
        }
    }
    catch (const std::exception& ex)
    {
        fail(st, std::string("translation worker error: ") + ex.what());
    }
}

bool BatchScheduler::translateSingle(CallState& st, std::size_t index)
{
    if (st.failed.load())
        return false;

    BatchResult res;
    if (request(st, { st.segments[index].content }, res) != Outcome::Success)
        return false;
    resolve(st, index, std::move(res.translations.front()), true);
    return true;
}

BatchScheduler::Outcome BatchScheduler::request(CallState& st, const std::vector<std::string>& texts,
                                                BatchResult& out)
{
    const bool single = texts.size() == 1;
    const int max_attempts = retry_.maxAttempts();
    std::string last_error;

    for (int attempt = 1; attempt <= max_attempts; ++attempt)
    {
        if (st.failed.load())
            return Outcome::Failed;

        {
            utils::Semaphore::Guard slot(requests_);
            out = translator_.submit(texts, opts_.source_lang, opts_.target_lang);
        }

        bool retryable = out.retryable;
        if (out.status != BatchStatus::Failed)
        {
            stats_.api_calls.fetch_add(1, std::memory_order_relaxed);
            stats_.prompt_tokens.fetch_add(out.usage.prompt_tokens, std::memory_order_relaxed);
            stats_.completion_tokens.fetch_add(out.usage.completion_tokens, std::memory_order_relaxed);

            // Sources reaching the service are never blank, so a blank translation lost text.
            const bool complete = out.status == BatchStatus::Ok && out.translations.size() == texts.size();
            if (complete && !has_blank_translation(out.translations))
                return Outcome::Success;
            if (!single)
                return Outcome::Mismatch;

            // A single text has no batch shape to fall back from; ask again.
            if (complete)
                last_error = "received an empty translation";
            else if (!out.error_message.empty())
                last_error = out.error_message;
            else
                last_error = "expected 1 translation, received " + std::to_string(out.translations.size());
            retryable = true;
        }
        else
        {
            last_error = out.error_message.empty() ? std::string("unknown error") : out.error_message;
        }

        if (!retryable || attempt >= max_attempts)
            break;

        stats_.retries.fetch_add(1, std::memory_order_relaxed);
        const double delay = retry_.delayFor(attempt, out.retry_after_seconds);
        PLOG_DEBUG << "Retry attempt " << attempt << " after error: " << last_error << ". Waiting " << delay << "s";
        st.retry->onRetry(attempt, last_error, delay);
        retry_.sleep(delay);
    }

    fail(st, last_error);
    return Outcome::Failed;
}

void BatchScheduler::resolve(CallState& st, std::size_t index, std::string translation, bool store)
{
    auto& seg = st.segments[index];
    if (store && cache_ && st.keys[index])
    {
        const auto& key = *st.keys[index];
        cache_->set(key.fingerprint(), translation,
                    cache::CacheEntryMetadata{ key.content_hash, key.target_lang, key.model, key.source_lang });
    }
    seg.translation = std::move(translation);
    st.progress->onProgress(1);
    st.segment->onSegmentReady(seg);
}

void BatchScheduler::fail(CallState& st, const std::string& error)
{
    bool expected = false;
    if (st.failed.compare_exchange_strong(expected, true))
    {
        std::lock_guard<std::mutex> lk(st.error_mutex);
        st.error = error;
        PLOG_ERROR << "Translation failed: " << error;
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Translation, "Translation failed", error);
    }
}

} // namespace translate
