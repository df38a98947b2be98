#include "ILLMTranslator.hpp"
#include "BatchCodec.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <cctype>

namespace translate
{

ILLMTranslator::ILLMTranslator() = default;

ILLMTranslator::~ILLMTranslator()
{
    shutdown();
}

bool ILLMTranslator::init(const BackendConfig& cfg)
{
    shutdown();
    cfg_ = cfg;
    setLastError({});

    const auto validation_error = validateConfig(cfg_);
    if (!validation_error.empty())
    {
        setLastError(validation_error);
        return false;
    }

    onInit();

    running_.store(true, std::memory_order_relaxed);
    return true;
}

bool ILLMTranslator::isReady() const
{
    return running_.load(std::memory_order_relaxed) && hasValidRuntimeConfig();
}

void ILLMTranslator::shutdown()
{
    // Transfers in progress observe the flag through their progress callback and abort.
    running_.store(false, std::memory_order_relaxed);
}

BatchResult ILLMTranslator::submit(const std::vector<std::string>& texts, const std::string& src_lang,
                                   const std::string& dst_lang)
{
    BatchResult result;
    result.expected = texts.size();

    if (!isReady())
    {
        result.error_message = "translator not ready";
        setLastError(result.error_message);
        return result;
    }

    if (texts.empty())
    {
        result.status = BatchStatus::Ok;
        return result;
    }

    for (const auto& text : texts)
    {
        bool all_space = std::all_of(text.begin(), text.end(),
                                     [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; });
        if (all_space)
        {
            result.error_message = "Empty text";
            setLastError(result.error_message);
            return result;
        }
    }

    Job job;
    job.texts = texts;
    job.src = src_lang;
    job.dst = dst_lang;

    result = performRequest(job);
    if (result.status == BatchStatus::Failed)
        setLastError(result.error_message);
    return result;
}

std::string ILLMTranslator::lastError() const
{
    std::lock_guard<std::mutex> lk(err_mtx_);
    return last_error_;
}

void ILLMTranslator::setLastError(const std::string& message)
{
    std::lock_guard<std::mutex> lk(err_mtx_);
    last_error_ = message;
}

std::string ILLMTranslator::testConnection()
{
    return testConnectionImpl();
}

void ILLMTranslator::onInit() {}

std::string ILLMTranslator::validateConfig(const BackendConfig&) const
{
    return {};
}

bool ILLMTranslator::hasValidRuntimeConfig() const
{
    return true;
}

bool ILLMTranslator::shouldRetry(const HttpResponse& resp) const
{
    return helpers::is_retryable(resp.status_code, resp.error);
}

void ILLMTranslator::augmentPromptContext(const Job&, PromptContext&) const {}

void ILLMTranslator::configureSession(const Job&, SessionConfig& cfg) const
{
    cfg.connect_timeout_ms = cfg_.connect_timeout_ms > 0 ? cfg_.connect_timeout_ms : 10000;
    cfg.timeout_ms = cfg_.timeout_ms > 0 ? cfg_.timeout_ms : 60000;
}

std::string ILLMTranslator::connectionSuccessMessage() const
{
    return std::string("Success: ") + providerName() + " connection test passed";
}

std::string ILLMTranslator::testConnectionImpl()
{
    if (!isReady())
        return "Error: Translator not ready - " + lastError();

    Job job;
    job.texts.push_back("Hello");
    job.src = "en";
    job.dst = cfg_.target_lang.empty() ? "fr" : cfg_.target_lang;

    const auto result = performRequest(job);
    if (result.ok() && !result.translations.empty() && !result.translations.front().empty())
        return connectionSuccessMessage();

    if (!result.error_message.empty())
        return "Error: Test translation failed - " + result.error_message;

    return "Error: Test translation failed";
}

std::string ILLMTranslator::defaultSystemPrompt()
{
    return "You are a professional technical documentation translator.\n"
           "Translate all provided text into {target_lang} while preserving Markdown structure and formatting.\n"
           "Do not translate fenced code blocks, inline code spans, URLs, or image paths.\n"
           "Do not add commentary or explanations; respond with the translated text only.{glossary}";
}

std::string ILLMTranslator::buildGlossarySnippet() const
{
    if (cfg_.glossary.empty())
        return {};
    std::string snippet = "\nGlossary (use these translations verbatim):";
    for (const auto& [source, target] : cfg_.glossary)
        snippet += "\n- " + source + " -> " + target;
    return snippet;
}

ILLMTranslator::Prompt ILLMTranslator::buildPrompt(const Job& job) const
{
    PromptContext ctx;
    ctx.source_lang = job.src.empty() ? "auto" : job.src;
    ctx.target_lang = job.dst.empty() ? cfg_.target_lang : job.dst;
    ctx.replacements.emplace_back("{target_lang}", languageDisplayName(ctx.target_lang));
    ctx.replacements.emplace_back("{source_lang}", languageDisplayName(ctx.source_lang));
    ctx.replacements.emplace_back("{glossary}", buildGlossarySnippet());
    augmentPromptContext(job, ctx);

    std::string system_prompt = cfg_.prompt.empty() ? defaultSystemPrompt() : cfg_.prompt;
    for (const auto& repl : ctx.replacements)
        replaceAll(system_prompt, repl.first, repl.second);

    Prompt prompt;
    if (!system_prompt.empty())
        prompt.messages.push_back({ Role::System, std::move(system_prompt) });
    prompt.messages.push_back({ Role::User, buildUserMessage(job) });
    return prompt;
}

std::string ILLMTranslator::buildUserMessage(const Job& job) const
{
    const std::string target = job.dst.empty() ? cfg_.target_lang : job.dst;

    std::string message;
    if (job.src.empty() || job.src == "auto")
        message += "Detect the source language automatically.\n";
    else
        message += "The source language is " + languageDisplayName(job.src) + ".\n";
    message += "The target language is " + languageDisplayName(target) + ".\n";

    if (job.isBatch())
    {
        message += batch_instructions(job.texts.size()) + "\n";
        message += "---\n";
        message += encode_batch(job.texts);
        message += "---";
    }
    else
    {
        message += "Translate the following content. Return only the translated text without wrapping quotes.\n";
        message += "---\n";
        message += job.texts.front();
        message += "\n---";
    }
    return message;
}

std::string ILLMTranslator::languageDisplayName(const std::string& lang)
{
    std::string lower;
    lower.reserve(lang.size());
    for (char c : lang)
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    std::replace(lower.begin(), lower.end(), '_', '-');

    if (lower == "en" || lower == "en-us" || lower == "en-gb")
        return "English";
    if (lower == "zh-cn" || lower == "zh-hans" || lower == "zh")
        return "Simplified Chinese";
    if (lower == "zh-tw" || lower == "zh-hant")
        return "Traditional Chinese";
    if (lower == "ja" || lower == "ja-jp")
        return "Japanese";
    if (lower == "ko" || lower == "ko-kr")
        return "Korean";
    if (lower == "fr" || lower == "fr-fr")
        return "French";
    if (lower == "de" || lower == "de-de")
        return "German";
    if (lower == "es" || lower == "es-es")
        return "Spanish";
    if (lower == "pt" || lower == "pt-br")
        return lower == "pt-br" ? "Brazilian Portuguese" : "Portuguese";
    if (lower == "it")
        return "Italian";
    if (lower == "ru")
        return "Russian";
    return lang.empty() ? "target language" : lang;
}

void ILLMTranslator::replaceAll(std::string& target, const std::string& placeholder, const std::string& value)
{
    if (placeholder.empty())
        return;
    size_t pos = 0;
    while ((pos = target.find(placeholder, pos)) != std::string::npos)
    {
        target.replace(pos, placeholder.length(), value);
        pos += value.length();
    }
}

BatchResult ILLMTranslator::performRequest(const Job& job)
{
    const auto prompt = buildPrompt(job);

    nlohmann::json body_json = nlohmann::json::object();
    buildRequestBody(job, prompt, body_json);
    const std::string body = body_json.dump();
    PLOG_DEBUG << providerName() << " request model=" << cfg_.model << " target=" << job.dst
               << " texts=" << job.texts.size() << " bytes=" << body.size();

    std::vector<Header> headers;
    buildHeaders(job, headers);

    SessionConfig session_cfg;
    session_cfg.cancel_flag = &running_;
    configureSession(job, session_cfg);

    const auto url = buildUrl(job);
    const auto response = translate::post_json(url, body, headers, session_cfg);
    return interpretResponse(job, response);
}

BatchResult ILLMTranslator::interpretResponse(const Job& job, const HttpResponse& response) const
{
    BatchResult result;
    result.expected = job.texts.size();

    if (!response.error.empty() || response.status_code < 200 || response.status_code >= 300)
    {
        auto err_type = helpers::categorize_http_error(response.status_code, response.error);
        const std::string snippet = helpers::shorten(!response.error.empty() ? response.error : response.text);
        result.error_message = helpers::get_error_description(err_type, response.status_code, snippet);
        result.retryable = shouldRetry(response);
        result.retry_after_seconds = response.retry_after_seconds;
        if (err_type == helpers::HttpErrorType::PayloadTooLarge && job.isBatch())
        {
            // Smaller requests may still fit; let the caller split the batch.
            result.status = BatchStatus::CountMismatch;
            PLOG_WARNING << providerName() << " rejected a batch of " << job.texts.size() << " as too large";
            return result;
        }
        PLOG_WARNING << providerName() << " request failed: " << result.error_message;
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Translation,
                                            std::string(providerName()) + " request failed", result.error_message);
        return result;
    }

    auto parse = parseResponse(job, response);
    result.usage = parse.usage;
    if (!parse.ok)
    {
        result.error_message = parse.error_message.empty() ? "parse error" : parse.error_message;
        result.retryable = parse.retryable;
        result.retry_after_seconds = parse.retry_after_seconds;
        PLOG_WARNING << providerName() << " response parse failed: " << result.error_message;
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Translation,
                                            std::string(providerName()) + " response parse failed",
                                            result.error_message);
        return result;
    }

    if (!job.isBatch())
    {
        const auto& content = parse.content;
        bool blank = std::all_of(content.begin(), content.end(),
                                 [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; });
        if (blank)
        {
            result.error_message = std::string(providerName()) + " returned an empty translation";
            result.retryable = true;
            return result;
        }
        result.translations.push_back(restore_edge_whitespace(job.texts.front(), content));
        result.received = 1;
        result.status = BatchStatus::Ok;
        return result;
    }

    auto parsed = parse_batch_response(parse.content, job.texts.size());
    result.received = parsed.received;
    if (!parsed.ok)
    {
        result.status = BatchStatus::CountMismatch;
        if (parsed.received == parsed.expected)
            result.error_message = "Batch response left " + std::to_string(parsed.blank) + " of " +
                                   std::to_string(parsed.expected) + " translations empty";
        else
            result.error_message = "Batch response contained " + std::to_string(parsed.received) + " of " +
                                   std::to_string(parsed.expected) + " translations";
        PLOG_WARNING << providerName() << " " << result.error_message;
        return result;
    }

    result.translations.reserve(parsed.translations.size());
    for (std::size_t i = 0; i < parsed.translations.size(); ++i)
        result.translations.push_back(restore_edge_whitespace(job.texts[i], parsed.translations[i]));
    result.status = BatchStatus::Ok;
    return result;
}

} // namespace translate
