#pragma once

#include <picosha2.h>

#include <string>
#include <string_view>

namespace cache
{

// Identity of a translation: same content, language pair and model give the same text.
struct CacheKey
{
    std::string content_hash;
    std::string target_lang;
    std::string model;
    std::string source_lang;

    static CacheKey make(std::string_view content, const std::string& target_lang, const std::string& model,
                         const std::string& source_lang)
    {
        return CacheKey{ picosha2::hash256_hex_string(content.begin(), content.end()), target_lang, model, source_lang };
    }

    std::string fingerprint() const
    {
        return picosha2::hash256_hex_string(content_hash + ":" + target_lang + ":" + model + ":" + source_lang);
    }
};

} // namespace cache
