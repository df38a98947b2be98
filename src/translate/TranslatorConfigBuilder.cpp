#include "ITranslator.hpp"
#include "../config/AppSettings.hpp"

#include <algorithm>
#include <cmath>

namespace translate
{

static int seconds_to_ms(double seconds)
{
    if (seconds <= 0.0)
        return 0;
    return static_cast<int>(std::lround(seconds * 1000.0));
}

BackendConfig BackendConfig::from(const ::AppSettings& settings)
{
    BackendConfig out;
    if (!parseBackend(settings.backend, out.backend))
        out.backend = Backend::OpenRouter;
    out.target_lang = settings.target_lang;
    out.base_url = settings.base_url;
    out.model = settings.model;
    out.api_key = settings.api_key;
    out.prompt = settings.system_prompt;
    out.timeout_ms = seconds_to_ms(settings.timeout);
    // Connecting should never take longer than the whole request.
    out.connect_timeout_ms = std::min(out.timeout_ms, 10000);
    return out;
}

} // namespace translate
