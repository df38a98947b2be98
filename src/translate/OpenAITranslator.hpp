#pragma once

#include "ILLMTranslator.hpp"

namespace translate
{

// Chat-completions client shared by OpenAI and OpenRouter; the backend only changes
// the provider name and a couple of attribution headers.
class OpenAITranslator : public ILLMTranslator
{
public:
    static std::string normalizeURL(const std::string& base_url);
    static std::string modelsURL(const std::string& base_url);

protected:
    const char* providerName() const override;
    std::string validateConfig(const BackendConfig& cfg) const override;
    bool hasValidRuntimeConfig() const override;
    void buildHeaders(const Job& job, std::vector<Header>& headers) const override;
    std::string buildUrl(const Job& job) const override;
    void buildRequestBody(const Job& job, const Prompt& prompt, nlohmann::json& body) const override;
    ParseResult parseResponse(const Job& job, const HttpResponse& resp) const override;
    std::string connectionSuccessMessage() const override;
    std::string testConnectionImpl() override;
};

} // namespace translate
