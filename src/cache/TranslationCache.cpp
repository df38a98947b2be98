#include "TranslationCache.hpp"
#include "../utils/ErrorReporter.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <plog/Log.h>

using json = nlohmann::json;

namespace fs = std::filesystem;

namespace cache
{

TranslationCache::TranslationCache(std::size_t capacity)
    : entries_(capacity)
{
}

TranslationCache::~TranslationCache()
{
    close();
}

bool TranslationCache::open(const fs::path& dir, std::string& error)
{
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec)
    {
        error = "Cannot create cache directory " + dir.string() + ": " + ec.message();
        return false;
    }
    journal_path_ = dir / kJournalName;

    std::ifstream file(journal_path_, std::ios::binary);
    if (!file.is_open())
    {
        PLOG_INFO << "TranslationCache: starting new journal at " << journal_path_.string();
        return true;
    }

    std::string line;
    std::size_t line_number = 0;
    std::size_t loaded = 0;
    std::size_t skipped = 0;
    while (std::getline(file, line))
    {
        ++line_number;
        if (line.empty() || line.find_first_not_of(" \t\r\n") == std::string::npos)
            continue;

        try
        {
            json entry = json::parse(line);
            if (!entry.contains("key") || !entry.contains("translation"))
            {
                ++skipped;
                continue;
            }
            entries_.put(entry["key"].get<std::string>(), entry["translation"].get<std::string>());
            ++loaded;
        }
        catch (const json::exception& e)
        {
            // A torn last line after a crash is expected; anything else is worth a warning.
            PLOG_WARNING << "TranslationCache: skipping line " << line_number << ": " << e.what();
            ++skipped;
        }
    }

    PLOG_INFO << "TranslationCache: loaded " << loaded << " entries from " << journal_path_.string()
              << (skipped ? " (" + std::to_string(skipped) + " skipped)" : std::string());
    return true;
}

void TranslationCache::close()
{
    flush();
}

std::optional<std::string> TranslationCache::get(const std::string& fingerprint)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::string out;
    if (!entries_.get(fingerprint, out))
        return std::nullopt;
    return out;
}

void TranslationCache::set(const std::string& fingerprint, const std::string& translation,
                           const CacheEntryMetadata& metadata)
{
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.put(fingerprint, translation);
    if (journal_path_.empty())
        return;

    pending_.push_back({ fingerprint, translation, metadata });
    if (pending_.size() >= kFlushInterval)
        flushLocked();
}

bool TranslationCache::flush()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return flushLocked();
}

std::size_t TranslationCache::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

bool TranslationCache::flushLocked()
{
    if (pending_.empty() || journal_path_.empty())
        return true;

    std::ofstream out(journal_path_, std::ios::binary | std::ios::app);
    if (!out)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Cache, "Failed to write translation cache",
                                            "Cannot open " + journal_path_.string());
        return false;
    }

    for (const auto& entry : pending_)
    {
        json line = {
            { "key", entry.fingerprint },
            { "chunk_hash", entry.metadata.chunk_hash },
            { "target_lang", entry.metadata.target_lang },
            { "model", entry.metadata.model },
            { "source_lang", entry.metadata.source_lang },
            { "translation", entry.translation },
        };
        out << line.dump(-1, ' ', false, json::error_handler_t::replace) << '\n';
    }
    out.flush();
    if (!out)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Cache, "Failed to write translation cache",
                                            "Write error on " + journal_path_.string());
        return false;
    }

    PLOG_DEBUG << "TranslationCache: journaled " << pending_.size() << " entries";
    pending_.clear();
    return true;
}

} // namespace cache
