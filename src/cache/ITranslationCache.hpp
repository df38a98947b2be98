#pragma once

#include <optional>
#include <string>

namespace cache
{

struct CacheEntryMetadata
{
    std::string chunk_hash;
    std::string target_lang;
    std::string model;
    std::string source_lang;
};

class ITranslationCache
{
public:
    virtual ~ITranslationCache() = default;

    virtual std::optional<std::string> get(const std::string& fingerprint) = 0;
    virtual void set(const std::string& fingerprint, const std::string& translation,
                     const CacheEntryMetadata& metadata) = 0;
    virtual bool flush() = 0;
};

} // namespace cache
