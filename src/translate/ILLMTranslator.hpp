#pragma once

#include "ITranslator.hpp"

#include "TranslatorHelpers.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/HttpCommon.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace translate
{

class ILLMTranslator : public ITranslator
{
public:
    ILLMTranslator();
    ~ILLMTranslator() override;

    bool init(const BackendConfig& cfg) override;
    bool isReady() const override;
    void shutdown() override;
    BatchResult submit(const std::vector<std::string>& texts, const std::string& src_lang,
                       const std::string& dst_lang) override;

    std::string lastError() const override;

    std::string testConnection() override;

protected:
    struct Job
    {
        std::vector<std::string> texts;
        std::string src;
        std::string dst;

        bool isBatch() const { return texts.size() > 1; }
    };

    enum class Role
    {
        System,
        User,
        Assistant
    };

    struct ChatMessage
    {
        Role role = Role::User;
        std::string content;
    };

    struct Prompt
    {
        std::vector<ChatMessage> messages;
    };

    struct PromptContext
    {
        std::string source_lang;
        std::string target_lang;
        std::vector<std::pair<std::string, std::string>> replacements;
    };

    struct ParseResult
    {
        bool ok = false;
        bool retryable = false;
        double retry_after_seconds = 0.0;
        std::string error_message;
        std::string content;
        TokenUsage usage;
    };

    virtual const char* providerName() const = 0;
    virtual void onInit();
    virtual std::string validateConfig(const BackendConfig& cfg) const;
    virtual bool hasValidRuntimeConfig() const;
    virtual void buildHeaders(const Job& job, std::vector<Header>& headers) const = 0;
    virtual std::string buildUrl(const Job& job) const = 0;
    virtual void buildRequestBody(const Job& job, const Prompt& prompt, nlohmann::json& body) const = 0;
    virtual ParseResult parseResponse(const Job& job, const HttpResponse& resp) const = 0;
    virtual bool shouldRetry(const HttpResponse& resp) const;
    virtual void augmentPromptContext(const Job& job, PromptContext& ctx) const;
    virtual void configureSession(const Job& job, SessionConfig& cfg) const;
    virtual std::string connectionSuccessMessage() const;
    virtual std::string testConnectionImpl();

    Prompt buildPrompt(const Job& job) const;
    std::string buildUserMessage(const Job& job) const;
    std::string buildGlossarySnippet() const;
    static std::string defaultSystemPrompt();
    static std::string languageDisplayName(const std::string& lang);
    static void replaceAll(std::string& target, const std::string& placeholder, const std::string& value);
    BatchResult performRequest(const Job& job);
    BatchResult interpretResponse(const Job& job, const HttpResponse& response) const;
    void setLastError(const std::string& message);

    BackendConfig cfg_{};
    std::atomic<bool> running_{ false };

private:
    mutable std::mutex err_mtx_;
    std::string last_error_;
};

} // namespace translate
