#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

// One source of settings (command line, config file or environment). Unset fields
// fall through to the next source in precedence order.
struct SettingsLayer
{
    std::optional<std::string> input;
    std::optional<std::string> output;
    std::optional<std::vector<std::string>> extensions;
    std::optional<std::string> target_lang;
    std::optional<std::string> source_lang;

    std::optional<std::string> backend;
    std::optional<std::string> base_url;
    std::optional<std::string> model;
    std::optional<std::string> api_key;
    std::optional<std::string> system_prompt;
    std::optional<std::string> glossary;

    std::optional<int> concurrency;
    std::optional<int> max_pending_batches;
    std::optional<int> retry;
    std::optional<double> timeout;
    std::optional<int> batch_chars;
    std::optional<int> batch_segments;

    std::optional<std::vector<std::string>> include;
    std::optional<std::vector<std::string>> exclude;

    std::optional<std::string> chunk_strategy;
    std::optional<int> max_chars;
    // Kept as text so a malformed environment value can be reported.
    std::optional<std::string> split_threshold;
    std::optional<bool> translate_code;
    std::optional<bool> translate_frontmatter;

    std::optional<bool> dry_run;
    std::optional<bool> backup;
    std::optional<bool> stream_writes;
    std::optional<bool> debug;
    std::optional<bool> check;

    std::optional<bool> cache_enabled;
    std::optional<std::string> cache_dir;
    std::optional<int> cache_capacity;
};

struct AppSettings
{
    static constexpr const char* kDefaultModel = "openrouter/auto";
    static constexpr int kDefaultMaxChars = 4000;
    static constexpr double kDefaultTimeout = 60.0;
    static constexpr int kDefaultRetry = 3;
    static constexpr int kDefaultBatchChars = 16000;
    static constexpr int kDefaultBatchSegments = 6;

    std::string input;
    std::string output;
    std::vector<std::string> extensions;
    std::string target_lang;
    std::string source_lang;

    std::string backend;
    std::string base_url;
    std::string model;
    std::string api_key;
    std::string system_prompt;
    std::string glossary;

    int concurrency;
    int max_pending_batches;
    int retry;
    double timeout;
    int batch_chars;
    int batch_segments;

    std::vector<std::string> include;
    std::vector<std::string> exclude;

    std::string chunk_strategy;
    int max_chars;
    std::optional<int> split_threshold;
    bool translate_code;
    bool translate_frontmatter;

    bool dry_run;
    bool backup;
    bool stream_writes;
    bool debug;
    bool check;

    bool cache_enabled;
    std::string cache_dir;
    std::size_t cache_capacity;

    AppSettings() { applyDefaults(); }

    void applyDefaults()
    {
        input.clear();
        output.clear();
        extensions = { "md" };
        target_lang.clear();
        source_lang = "auto";

        backend = "openrouter";
        base_url.clear();
        model = kDefaultModel;
        api_key.clear();
        system_prompt.clear();
        glossary.clear();

        concurrency = 4;
        max_pending_batches = 8;
        retry = kDefaultRetry;
        timeout = kDefaultTimeout;
        batch_chars = kDefaultBatchChars;
        batch_segments = kDefaultBatchSegments;

        include.clear();
        exclude.clear();

        chunk_strategy = "markdown";
        max_chars = kDefaultMaxChars;
        split_threshold.reset();
        translate_code = false;
        translate_frontmatter = false;

        dry_run = false;
        backup = true;
        stream_writes = false;
        debug = false;
        check = false;

        cache_enabled = false;
        cache_dir = ".transfold-cache";
        cache_capacity = 100000;
    }
};
