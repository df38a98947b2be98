#include "ITranslator.hpp"
#include "OpenAITranslator.hpp"

#include <algorithm>
#include <cctype>
#include <memory>

namespace translate
{
std::unique_ptr<ITranslator> createTranslator(Backend backend)
{
    switch (backend)
    {
    case Backend::OpenAI:
    case Backend::OpenRouter:
        return std::make_unique<OpenAITranslator>();
    default:
        return nullptr;
    }
}

const char* backendName(Backend backend)
{
    switch (backend)
    {
    case Backend::OpenAI:
        return "openai";
    case Backend::OpenRouter:
        return "openrouter";
    default:
        return "unknown";
    }
}

bool parseBackend(const std::string& name, Backend& out)
{
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "openai")
    {
        out = Backend::OpenAI;
        return true;
    }
    if (lower == "openrouter")
    {
        out = Backend::OpenRouter;
        return true;
    }
    return false;
}
} // namespace translate
