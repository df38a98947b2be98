#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

struct AppSettings;

namespace translate
{
    enum class Backend
    {
        OpenAI = 0,
        OpenRouter = 1
    };

    const char* backendName(Backend backend);
    bool parseBackend(const std::string& name, Backend& out);

    struct BackendConfig
    {
        Backend backend = Backend::OpenRouter;
        std::string target_lang;
        std::string base_url;
        std::string model;
        std::string api_key;
        // Replaces the built-in system prompt; "{target_lang}" and "{source_lang}" are substituted.
        std::string prompt;
        std::map<std::string, std::string> glossary;
        int timeout_ms = 60000;
        int connect_timeout_ms = 10000;
        double temperature = 0.0;

        static BackendConfig from(const ::AppSettings& settings);
    };

    struct TokenUsage
    {
        std::uint64_t prompt_tokens = 0;
        std::uint64_t completion_tokens = 0;
    };

    enum class BatchStatus
    {
        Ok,
        Failed,
        // The service answered, but not with one translation per input text.
        CountMismatch
    };

    struct BatchResult
    {
        BatchStatus status = BatchStatus::Failed;
        bool retryable = false;
        double retry_after_seconds = 0.0;
        std::vector<std::string> translations;
        std::size_t expected = 0;
        std::size_t received = 0;
        TokenUsage usage;
        std::string error_message;

        bool ok() const { return status == BatchStatus::Ok; }
    };

    /// Remote translation port: N texts in, N translations out or an error.
    /// submit() is called from several scheduler threads at once.
    class ITranslator
    {
    public:
        virtual ~ITranslator() = default;
        virtual bool init(const BackendConfig& cfg) = 0;
        virtual bool isReady() const = 0;
        virtual void shutdown() = 0;
        virtual BatchResult submit(const std::vector<std::string>& texts, const std::string& src_lang,
                                   const std::string& dst_lang) = 0;
        virtual std::string lastError() const = 0;
        virtual std::string testConnection() = 0;
    };

    // Factory function to create translators based on backend type
    std::unique_ptr<ITranslator> createTranslator(Backend backend);
}
