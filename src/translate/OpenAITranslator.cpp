#include "OpenAITranslator.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

namespace translate
{

namespace
{

std::string extract_content(const nlohmann::json& content)
{
    if (content.is_string())
        return content.get<std::string>();

    // Some OpenRouter models answer with a list of typed parts.
    std::string text;
    if (content.is_array())
    {
        for (const auto& part : content)
        {
            if (part.is_string())
                text += part.get<std::string>();
            else if (part.is_object() && part.contains("text") && part["text"].is_string())
                text += part["text"].get<std::string>();
        }
    }
    return text;
}

std::uint64_t read_count(const nlohmann::json& obj, const char* key)
{
    if (!obj.contains(key) || !obj[key].is_number_integer())
        return 0;
    const auto value = obj[key].get<std::int64_t>();
    return value > 0 ? static_cast<std::uint64_t>(value) : 0;
}

} // namespace

const char* OpenAITranslator::providerName() const
{
    return cfg_.backend == Backend::OpenRouter ? "OpenRouter" : "OpenAI";
}

std::string OpenAITranslator::validateConfig(const BackendConfig& cfg) const
{
    if (cfg.api_key.empty())
        return "Missing API key";
    if (cfg.base_url.empty())
        return "Missing base URL";
    if (cfg.model.empty())
        return "Missing model";
    return {};
}

bool OpenAITranslator::hasValidRuntimeConfig() const
{
    return !cfg_.api_key.empty() && !cfg_.model.empty() && !cfg_.base_url.empty();
}

void OpenAITranslator::buildHeaders(const Job&, std::vector<Header>& headers) const
{
    headers.push_back({ "Content-Type", "application/json" });
    headers.push_back({ "Authorization", std::string("Bearer ") + cfg_.api_key });
    if (cfg_.backend == Backend::OpenRouter)
    {
        headers.push_back({ "HTTP-Referer", "https://github.com/transfold/transfold" });
        headers.push_back({ "X-Title", "transfold" });
    }
}

std::string OpenAITranslator::buildUrl(const Job&) const
{
    return normalizeURL(cfg_.base_url);
}

void OpenAITranslator::buildRequestBody(const Job&, const Prompt& prompt, nlohmann::json& body) const
{
    body["model"] = cfg_.model;
    nlohmann::json messages = nlohmann::json::array();
    for (const auto& message : prompt.messages)
    {
        std::string role = "user";
        switch (message.role)
        {
        case Role::System:
            role = "system";
            break;
        case Role::Assistant:
            role = "assistant";
            break;
        default:
            role = "user";
            break;
        }
        messages.push_back({ { "role", role }, { "content", message.content } });
    }
    body["messages"] = std::move(messages);
    body["temperature"] = cfg_.temperature;
}

ILLMTranslator::ParseResult OpenAITranslator::parseResponse(const Job&, const HttpResponse& resp) const
{
    ParseResult result;
    try
    {
        auto json = nlohmann::json::parse(resp.text);

        if (json.contains("usage") && json["usage"].is_object())
        {
            result.usage.prompt_tokens = read_count(json["usage"], "prompt_tokens");
            result.usage.completion_tokens = read_count(json["usage"], "completion_tokens");
        }

        // OpenRouter reports upstream provider failures inside a 200 response.
        if (json.contains("error") && json["error"].is_object())
        {
            const auto& error = json["error"];
            result.error_message = "Provider error: ";
            if (error.contains("message") && error["message"].is_string())
                result.error_message += error["message"].get<std::string>();
            else
                result.error_message += helpers::shorten(error.dump());
            int code = 0;
            if (error.contains("code") && error["code"].is_number_integer())
                code = error["code"].get<int>();
            result.retryable = code == 0 || helpers::is_retryable(code, {});
            return result;
        }

        if (!json.contains("choices") || !json["choices"].is_array() || json["choices"].empty())
        {
            result.error_message = "missing choices in response";
            result.retryable = true;
            return result;
        }

        const auto& choice = json["choices"].at(0);
        if (!choice.contains("message") || !choice["message"].contains("content"))
        {
            result.error_message = "missing message content";
            result.retryable = true;
            return result;
        }

        result.content = extract_content(choice["message"]["content"]);
        result.ok = true;
        PLOG_DEBUG << providerName() << " response: " << helpers::shorten(result.content, 120);
        return result;
    }
    catch (const std::exception& ex)
    {
        result.error_message = std::string("parse error: ") + ex.what();
        result.retryable = true;
        return result;
    }
}

std::string OpenAITranslator::connectionSuccessMessage() const
{
    return "Success: Connection test passed, model responded correctly";
}

std::string OpenAITranslator::testConnectionImpl()
{
    if (cfg_.api_key.empty())
        return "Config Error: Missing API key";
    if (cfg_.base_url.empty())
        return "Config Error: Missing base URL";
    if (cfg_.model.empty())
        return "Config Error: Missing model";

    std::vector<Header> headers{ { "Authorization", std::string("Bearer ") + cfg_.api_key } };
    SessionConfig session;
    session.connect_timeout_ms = 3000;
    session.timeout_ms = 8000;
    session.cancel_flag = &running_;

    const auto resp = translate::get(modelsURL(cfg_.base_url), headers, session);
    if (!resp.error.empty())
        return "Error: Cannot connect to base URL - " + resp.error;
    if (resp.status_code < 200 || resp.status_code >= 300)
        return "Error: Base URL returned HTTP " + std::to_string(resp.status_code);

    // OpenRouter's auto router is not listed as a model.
    if (cfg_.model != "openrouter/auto" && resp.text.find('"' + cfg_.model + '"') == std::string::npos)
        return "Warning: Model '" + cfg_.model + "' not found in available models list";

    return ILLMTranslator::testConnectionImpl();
}

std::string OpenAITranslator::normalizeURL(const std::string& base_url)
{
    std::string url = base_url;

    while (!url.empty() && url.back() == '/')
        url.pop_back();

    if (url.empty())
        return url;

    size_t scheme_end = url.find("://");
    size_t path_start = (scheme_end != std::string::npos) ? url.find('/', scheme_end + 3) : url.find('/');

    if (path_start != std::string::npos)
    {
        std::string path = url.substr(path_start);
        if (path.find("/chat/completions") != std::string::npos)
            return url;
        if (path.size() >= 3 && path.compare(path.size() - 3, 3, "/v1") == 0)
            return url + "/chat/completions";
        return url;
    }

    return url + "/v1/chat/completions";
}

std::string OpenAITranslator::modelsURL(const std::string& base_url)
{
    std::string url = normalizeURL(base_url);
    const std::string suffix = "/chat/completions";
    if (url.size() >= suffix.size() && url.compare(url.size() - suffix.size(), suffix.size(), suffix) == 0)
        url.erase(url.size() - suffix.size());
    return url + "/models";
}

} // namespace translate
