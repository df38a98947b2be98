#include "SettingsResolver.hpp"
#include "AppSettings.hpp"
#include "../translate/ITranslator.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <optional>
#include <thread>

namespace
{

std::string trim(const std::string& s)
{
    std::size_t b = 0;
    while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    std::size_t e = s.size();
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return s.substr(b, e - b);
}

std::optional<std::string> env_value(const char* name)
{
    const char* v = std::getenv(name);
    if (v == nullptr || *v == '\0')
        return std::nullopt;
    return std::string(v);
}

template <typename T>
T pick(const std::optional<T>& cli, const std::optional<T>& file, const std::optional<T>& env, T fallback)
{
    if (cli)
        return *cli;
    if (file)
        return *file;
    if (env)
        return *env;
    return fallback;
}

// Empty strings count as unset so that `model = ""` in a config file falls through.
std::string pick_string(const std::optional<std::string>& cli, const std::optional<std::string>& file,
                        const std::optional<std::string>& env, const std::string& fallback)
{
    for (const auto* candidate : { &cli, &file, &env })
    {
        if (*candidate && !(*candidate)->empty())
            return **candidate;
    }
    return fallback;
}

int default_concurrency()
{
    unsigned int cpus = std::thread::hardware_concurrency();
    if (cpus == 0)
        cpus = 4;
    return static_cast<int>(std::min(8u, std::max(2u, cpus)));
}

const char* default_base_url(translate::Backend backend)
{
    switch (backend)
    {
    case translate::Backend::OpenAI:
        return "https://api.openai.com/v1/chat/completions";
    case translate::Backend::OpenRouter:
    default:
        return "https://openrouter.ai/api/v1/chat/completions";
    }
}

} // namespace

bool parse_bool(const std::string& text, bool& out)
{
    std::string lower = trim(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on")
    {
        out = true;
        return true;
    }
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off")
    {
        out = false;
        return true;
    }
    return false;
}

bool parse_int(const std::string& text, int& out)
{
    const std::string s = trim(text);
    if (s.empty())
        return false;
    errno = 0;
    char* end = nullptr;
    long v = std::strtol(s.c_str(), &end, 10);
    if (errno != 0 || end == s.c_str() || *end != '\0')
        return false;
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max())
        return false;
    out = static_cast<int>(v);
    return true;
}

bool parse_double(const std::string& text, double& out)
{
    const std::string s = trim(text);
    if (s.empty())
        return false;
    errno = 0;
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (errno != 0 || end == s.c_str() || *end != '\0')
        return false;
    out = v;
    return true;
}

std::vector<std::string> split_list(const std::string& text)
{
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start <= text.size())
    {
        std::size_t comma = text.find(',', start);
        if (comma == std::string::npos)
            comma = text.size();
        std::string item = trim(text.substr(start, comma - start));
        if (!item.empty())
            out.push_back(std::move(item));
        start = comma + 1;
    }
    return out;
}

bool load_env_file(const std::string& path, std::string& error)
{
    std::ifstream in(path);
    if (!in)
    {
        error = "Cannot open env file: " + path;
        return false;
    }

    std::string raw;
    while (std::getline(in, raw))
    {
        const std::string line = trim(raw);
        if (line.empty() || line[0] == '#')
            continue;

        const auto eq = line.find('=');
        const std::string key = trim(line.substr(0, eq));
        if (key.empty())
            continue;
        if (std::getenv(key.c_str()) != nullptr)
            continue;

        std::string value = eq == std::string::npos ? std::string() : trim(line.substr(eq + 1));
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
            (value.back() == '"' || value.back() == '\''))
        {
            value = value.substr(1, value.size() - 2);
        }
        ::setenv(key.c_str(), value.c_str(), 0);
    }
    PLOG_DEBUG << "Loaded environment from " << path;
    return true;
}

SettingsLayer settings_from_environment()
{
    SettingsLayer env;
    env.api_key = env_value("OPENROUTER_API_KEY");
    env.model = env_value("OPENROUTER_MODEL");
    if (!env.model)
        env.model = env_value("MODEL");
    env.base_url = env_value("OPENROUTER_BASE_URL");
    env.split_threshold = env_value("TRANSFOLD_SPLIT_THRESHOLD");
    return env;
}

bool resolve_settings(const SettingsLayer& cli, const SettingsLayer& file, const SettingsLayer& env,
                      AppSettings& out, std::string& error)
{
    out.applyDefaults();

    out.input = pick_string(cli.input, file.input, env.input, "");
    if (out.input.empty())
    {
        error = "--input is required";
        return false;
    }
    out.output = pick_string(cli.output, file.output, env.output, "");

    out.extensions = pick(cli.extensions, file.extensions, env.extensions, out.extensions);
    if (out.extensions.empty())
        out.extensions = { "md" };

    out.target_lang = pick_string(cli.target_lang, file.target_lang, env.target_lang, "");
    if (out.target_lang.empty())
    {
        error = "--target-lang is required";
        return false;
    }
    out.source_lang = pick_string(cli.source_lang, file.source_lang, env.source_lang, "auto");

    out.backend = pick_string(cli.backend, file.backend, env.backend, out.backend);
    translate::Backend backend = translate::Backend::OpenRouter;
    if (!translate::parseBackend(out.backend, backend))
    {
        error = "Unsupported backend: " + out.backend;
        return false;
    }
    out.base_url = pick_string(cli.base_url, file.base_url, env.base_url, default_base_url(backend));
    out.model = pick_string(cli.model, file.model, env.model, AppSettings::kDefaultModel);
    out.system_prompt = pick_string(cli.system_prompt, file.system_prompt, env.system_prompt, "");
    out.glossary = pick_string(cli.glossary, file.glossary, env.glossary, "");

    out.dry_run = pick(cli.dry_run, file.dry_run, env.dry_run, false);
    out.check = pick(cli.check, file.check, env.check, false);
    out.debug = pick(cli.debug, file.debug, env.debug, false);

    out.api_key = pick_string(cli.api_key, file.api_key, env.api_key, "");
    if (out.api_key.empty() && !out.dry_run)
    {
        error = "API key is required via --api-key or OPENROUTER_API_KEY";
        return false;
    }

    out.concurrency = pick(cli.concurrency, file.concurrency, env.concurrency, default_concurrency());
    if (out.concurrency < 1)
    {
        error = "concurrency must be at least 1";
        return false;
    }
    out.max_pending_batches =
        pick(cli.max_pending_batches, file.max_pending_batches, env.max_pending_batches, out.concurrency * 2);
    if (out.max_pending_batches < 1)
    {
        error = "max_pending_batches must be at least 1";
        return false;
    }

    out.retry = pick(cli.retry, file.retry, env.retry, AppSettings::kDefaultRetry);
    if (out.retry < 1)
    {
        error = "retry must be at least 1";
        return false;
    }
    out.timeout = pick(cli.timeout, file.timeout, env.timeout, AppSettings::kDefaultTimeout);
    if (out.timeout <= 0.0)
    {
        error = "timeout must be positive";
        return false;
    }

    out.batch_chars = pick(cli.batch_chars, file.batch_chars, env.batch_chars, AppSettings::kDefaultBatchChars);
    out.batch_segments =
        pick(cli.batch_segments, file.batch_segments, env.batch_segments, AppSettings::kDefaultBatchSegments);
    if (out.batch_chars < 1 || out.batch_segments < 1)
    {
        error = "batch limits must be positive";
        return false;
    }

    out.include = pick(cli.include, file.include, env.include, std::vector<std::string>{});
    out.exclude = pick(cli.exclude, file.exclude, env.exclude, std::vector<std::string>{});

    out.chunk_strategy = pick_string(cli.chunk_strategy, file.chunk_strategy, env.chunk_strategy, "markdown");
    out.max_chars = pick(cli.max_chars, file.max_chars, env.max_chars, AppSettings::kDefaultMaxChars);

    const std::string threshold = pick_string(cli.split_threshold, file.split_threshold, env.split_threshold, "");
    if (!threshold.empty())
    {
        int value = 0;
        if (!parse_int(threshold, value))
        {
            error = "split_threshold must be an integer";
            return false;
        }
        if (value <= 0)
        {
            error = "split_threshold must be a positive integer";
            return false;
        }
        out.split_threshold = value;
    }

    out.translate_code = pick(cli.translate_code, file.translate_code, env.translate_code, false);
    out.translate_frontmatter =
        pick(cli.translate_frontmatter, file.translate_frontmatter, env.translate_frontmatter, false);
    out.backup = pick(cli.backup, file.backup, env.backup, true);
    out.stream_writes = pick(cli.stream_writes, file.stream_writes, env.stream_writes, false);

    out.cache_enabled = pick(cli.cache_enabled, file.cache_enabled, env.cache_enabled, false);
    out.cache_dir = pick_string(cli.cache_dir, file.cache_dir, env.cache_dir, out.cache_dir);
    const int capacity = pick(cli.cache_capacity, file.cache_capacity, env.cache_capacity,
                              static_cast<int>(out.cache_capacity));
    out.cache_capacity = capacity > 0 ? static_cast<std::size_t>(capacity) : 0;

    return true;
}
