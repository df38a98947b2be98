#pragma once

#include "ITranslationCache.hpp"
#include "../utils/LRUCache.hpp"

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace cache
{

// Thread-safe LRU of finished translations. When opened on a directory, entries are
// loaded from <dir>/segments.jsonl and new entries are appended to it in groups.
class TranslationCache : public ITranslationCache
{
public:
    static constexpr const char* kJournalName = "segments.jsonl";
    static constexpr std::size_t kFlushInterval = 32;

    explicit TranslationCache(std::size_t capacity = 0);
    ~TranslationCache() override;

    // Creates the directory when missing and loads the existing journal.
    bool open(const std::filesystem::path& dir, std::string& error);
    void close();

    std::optional<std::string> get(const std::string& fingerprint) override;
    void set(const std::string& fingerprint, const std::string& translation,
             const CacheEntryMetadata& metadata) override;
    bool flush() override;

    std::size_t size() const;
    const std::filesystem::path& journalPath() const { return journal_path_; }

private:
    struct PendingEntry
    {
        std::string fingerprint;
        std::string translation;
        CacheEntryMetadata metadata;
    };

    bool flushLocked();

    mutable std::mutex mutex_;
    utils::LRUCache<std::string, std::string> entries_;
    std::vector<PendingEntry> pending_;
    std::filesystem::path journal_path_;
};

} // namespace cache
