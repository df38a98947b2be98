#include "Application.hpp"
#include "DocumentProcessor.hpp"
#include "ProgressReporter.hpp"
#include "../cache/TranslationCache.hpp"
#include "../config/ConfigManager.hpp"
#include "../config/SettingsResolver.hpp"
#include "../config/SettingsSerializer.hpp"
#include "../output/WriterThread.hpp"
#include "../processing/Segmenter.hpp"
#include "../translate/BatchScheduler.hpp"
#include "../translate/ITranslator.hpp"
#include "../utils/BoundedQueue.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/FileUtils.hpp"
#include "../utils/LogManager.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <atomic>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <thread>

#ifndef TRANSFOLD_VERSION_STRING
#define TRANSFOLD_VERSION_STRING "0.0.0"
#endif

namespace fs = std::filesystem;

namespace
{

processing::SegmentOptions segment_options(const AppSettings& settings)
{
    processing::SegmentOptions opts;
    opts.strategy = settings.chunk_strategy;
    opts.max_chars = settings.max_chars;
    opts.preserve_code = !settings.translate_code;
    opts.preserve_frontmatter = !settings.translate_frontmatter;
    opts.split_threshold = settings.split_threshold;
    return opts;
}

} // namespace

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

Application::~Application()
{
    if (cache_)
        cache_->close();
    if (translator_)
        translator_->shutdown();
    utils::LogManager::Shutdown();
}

int Application::run()
{
    start_time_ = std::chrono::steady_clock::now();

    switch (parseCommandLineArgs())
    {
    case ParseResult::ExitOk:
        return kExitOk;
    case ParseResult::Error:
        std::cerr << "transfold: " << usage_error_ << "\n";
        std::cerr << "Try 'transfold --help' for more information.\n";
        return kExitUsage;
    case ParseResult::Continue:
        break;
    }

    if (!initializeLogging())
        return kExitFailures;

    PLOG_INFO << "transfold " << TRANSFOLD_VERSION_STRING << " starting";

    if (!loadSettings())
        return kExitUsage;

    if (settings_.check)
        return runCheck();

    const fs::path input(settings_.input);
    std::error_code ec;
    if (!fs::exists(input, ec))
    {
        std::cerr << "Input path " << input.string() << " does not exist\n";
        utils::ErrorReporter::ReportError(utils::ErrorCategory::FileSystem, "Input path does not exist",
                                          input.string());
        return kExitFailures;
    }

    const auto files = utils::gather_files(input, settings_.extensions, settings_.include, settings_.exclude);
    if (files.empty())
    {
        std::cout << "No files matched the provided criteria.\n";
        return kExitOk;
    }
    PLOG_INFO << "Matched " << files.size() << " file(s) under " << input.string();

    if (settings_.dry_run)
        return runDryRun(files);
    return runTranslation(files);
}

bool Application::initializeLogging()
{
    if (!utils::LogManager::Initialize(config_path_))
    {
        std::cerr << "Failed to initialize logging system\n";
        return false;
    }

    const bool debug = cli_.debug.value_or(false);
    utils::LogManager::RegisterLogger<0>({ .name = "main",
                                           .filename = "transfold.log",
                                           .append_override = std::nullopt,
                                           .level_override = std::nullopt,
                                           .max_file_size = 10 * 1024 * 1024,
                                           .backup_count = 3,
                                           .console_level = debug ? plog::debug : plog::info });

    const auto error_log = utils::LogManager::LogPath("errors.log");
    if (!utils::LogManager::LogDirectory().empty() && !utils::ErrorReporter::InitializeLogFile(error_log.string()))
        PLOG_WARNING << "Cannot open " << error_log.string() << "; errors are only logged";

    if (debug)
        utils::LogManager::SetLogLevel(plog::debug);
    return true;
}

bool Application::loadSettings()
{
    if (!env_file_.empty())
    {
        std::string error;
        if (!load_env_file(env_file_, error))
        {
            std::cerr << error << "\n";
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to load env file",
                                              error);
            return false;
        }
    }

    SettingsLayer file_layer;
    config_ = std::make_unique<ConfigManager>(config_path_);
    TableCallbacks cb;
    cb.load = [&file_layer](const toml::table& root) { SettingsSerializer::deserialize(root, file_layer); };
    config_->registerTable("", std::move(cb), { "translation", "batch", "chunk", "files", "cache" });
    config_->reserveKeys("", { "global", "app" });
    if (!config_->load())
    {
        std::cerr << config_->lastError() << "\n";
        return false;
    }

    const SettingsLayer env_layer = settings_from_environment();
    std::string error;
    if (!resolve_settings(cli_, file_layer, env_layer, settings_, error))
    {
        std::cerr << "transfold: " << error << "\n";
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Invalid settings", error);
        return false;
    }

    if (settings_.debug)
    {
        utils::LogManager::SetLogLevel(plog::debug);
        utils::LogManager::SetConsoleLevel(plog::debug);
    }

    PLOG_INFO << "Target language: " << settings_.target_lang << ", source: " << settings_.source_lang
              << ", backend: " << settings_.backend << ", model: " << settings_.model;
    PLOG_DEBUG << "concurrency=" << settings_.concurrency << " pending=" << settings_.max_pending_batches
               << " batch=" << settings_.batch_chars << "/" << settings_.batch_segments
               << " max_chars=" << settings_.max_chars << " retry=" << settings_.retry
               << " timeout=" << settings_.timeout;
    return true;
}

int Application::runDryRun(const std::vector<fs::path>& files)
{
    const auto opts = segment_options(settings_);
    std::size_t total_segments = 0;
    std::size_t processed = 0;
    std::vector<std::string> errors;

    for (const auto& file : files)
    {
        app::PreparedDocument doc;
        std::string error;
        if (!app::PreparedDocument::load(file, opts, doc, error))
        {
            errors.push_back(file.string() + ": " + error);
            continue;
        }
        total_segments += doc.translatable;
        ++processed;
        std::cout << "[DRY RUN] " << displayPath(file) << " -> " << doc.translatable << " segments\n";
    }
    std::cout << "Total files: " << processed << ", segments requiring translation: " << total_segments << "\n";

    if (!errors.empty())
    {
        std::cout << "\nSkipped files due to errors:\n";
        for (const auto& item : errors)
            std::cout << " - " << item << "\n";
        return kExitFailures;
    }
    return kExitOk;
}

int Application::runCheck()
{
    std::string error;
    if (!createTranslator(error))
    {
        std::cerr << "Failed to initialise translator: " << error << "\n";
        return kExitFailures;
    }

    const std::string result = translator_->testConnection();
    std::cout << result << "\n";
    return result.rfind("Success", 0) == 0 ? kExitOk : kExitFailures;
}

int Application::runTranslation(const std::vector<fs::path>& files)
{
    std::string error;
    if (!createTranslator(error))
    {
        std::cerr << "Failed to initialise translator: " << error << "\n";
        return kExitFailures;
    }
    openCache();

    translate::SchedulerOptions sched_opts;
    sched_opts.target_lang = settings_.target_lang;
    sched_opts.source_lang = settings_.source_lang;
    sched_opts.model = settings_.model;
    sched_opts.concurrency = static_cast<std::size_t>(settings_.concurrency);
    sched_opts.max_pending_batches = static_cast<std::size_t>(settings_.max_pending_batches);
    sched_opts.max_batch_chars = static_cast<std::size_t>(settings_.batch_chars);
    sched_opts.max_batch_segments = static_cast<std::size_t>(settings_.batch_segments);
    sched_opts.retry.max_attempts = settings_.retry;
    translate::BatchScheduler scheduler(*translator_, sched_opts, cache_.get());

    output::WriterThread writer;
    writer.start();

    app::DocumentOptions doc_opts;
    doc_opts.input_root = fs::path(settings_.input);
    if (!settings_.output.empty())
        doc_opts.output_root = fs::path(settings_.output);
    doc_opts.backup = settings_.backup;
    doc_opts.stream_writes = settings_.stream_writes;

    app::ProgressReporter progress;
    app::DocumentProcessor processor(scheduler, writer, doc_opts);
    processor.setProgressObserver(&progress);
    processor.setRetryObserver(&progress);

    const auto seg_opts = segment_options(settings_);
    const std::size_t worker_count = static_cast<std::size_t>(std::max(1, settings_.concurrency));
    utils::BoundedQueue<std::unique_ptr<app::PreparedDocument>> queue(worker_count * 2);
    std::atomic<std::size_t> documents{ 0 };

    // File reads and segmentation stay off the document workers.
    std::jthread reader([&]() {
        for (const auto& file : files)
        {
            auto doc = std::make_unique<app::PreparedDocument>();
            std::string read_error;
            if (!app::PreparedDocument::load(file, seg_opts, *doc, read_error))
            {
                utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Segmentation,
                                                    "Skipping " + file.string(), read_error);
                recordFailure(file.string() + ": " + read_error);
                continue;
            }
            documents.fetch_add(1, std::memory_order_relaxed);
            progress.addTotal(doc->translatable);
            PLOG_DEBUG << "Prepared " << displayPath(file) << " (" << doc->document.size() << " segments, "
                       << doc->translatable << " translatable)";
            if (!queue.push(std::move(doc)))
                break;
        }
        queue.close();
    });

    std::vector<std::jthread> workers;
    workers.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i)
    {
        workers.emplace_back([&]() {
            while (auto item = queue.pop())
            {
                auto& doc = **item;
                std::string doc_error;
                if (!processor.process(doc, doc_error))
                {
                    recordFailure(doc.source.string() + ": " + doc_error);
                    continue;
                }
                PLOG_INFO << "Translated " << displayPath(doc.source);
            }
        });
    }

    reader.join();
    for (auto& worker : workers)
        worker.join();

    writer.close();
    if (writer.failedWrites() > 0)
        recordFailure(std::to_string(writer.failedWrites()) + " write(s) failed, see " +
                      utils::LogManager::LogPath("errors.log").string());
    if (cache_ && !cache_->flush())
        PLOG_WARNING << "Translation cache could not be flushed";
    translator_->shutdown();

    const auto stats = scheduler.stats().snapshot();
    const double elapsed =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time_).count();

    std::cout << "\nSummary\n=======\n";
    std::cout << "Files processed: " << documents.load() << "\n";
    std::cout << "Segments translated: " << stats.total_segments << "\n";
    if (stats.cached_segments)
        std::cout << "Cached segments: " << stats.cached_segments << "\n";
    std::cout << "API calls: " << stats.api_calls << "\n";
    if (stats.batches)
        std::cout << "Batches submitted: " << stats.batches << "\n";
    std::cout << "Retries performed: " << stats.retries << "\n";
    if (stats.prompt_tokens || stats.completion_tokens)
        std::cout << "Token usage: prompt=" << stats.prompt_tokens << ", completion=" << stats.completion_tokens
                  << "\n";
    std::cout << "Elapsed time: " << std::fixed << std::setprecision(2) << elapsed << "s\n";
    const auto reported = utils::ErrorReporter::GetCounts();
    if (reported.warnings > 0)
        std::cout << "Warnings: " << reported.warnings << " (see "
                  << utils::LogManager::LogPath("errors.log").string() << ")\n";

    std::lock_guard<std::mutex> lk(failures_mutex_);
    if (!failures_.empty())
    {
        std::cout << "\nFailures:\n";
        for (const auto& item : failures_)
            std::cout << " - " << item << "\n";
        return kExitFailures;
    }
    return kExitOk;
}

bool Application::createTranslator(std::string& error)
{
    translate::Backend backend = translate::Backend::OpenRouter;
    if (!translate::parseBackend(settings_.backend, backend))
    {
        error = "Unsupported backend: " + settings_.backend;
        return false;
    }

    auto cfg = translate::BackendConfig::from(settings_);
    if (!settings_.glossary.empty())
    {
        std::string glossary_error;
        if (!utils::read_glossary(settings_.glossary, cfg.glossary, glossary_error))
        {
            recordFailure("Failed to read glossary: " + glossary_error);
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration, "Failed to read glossary",
                                                glossary_error);
            cfg.glossary.clear();
        }
        else
        {
            PLOG_INFO << "Loaded " << cfg.glossary.size() << " glossary entries from " << settings_.glossary;
        }
    }

    translator_ = translate::createTranslator(backend);
    if (!translator_)
    {
        error = std::string("No translator for backend ") + translate::backendName(backend);
        return false;
    }
    if (!translator_->init(cfg))
    {
        error = translator_->lastError();
        return false;
    }
    return true;
}

void Application::openCache()
{
    if (!settings_.cache_enabled)
        return;

    auto cache = std::make_unique<cache::TranslationCache>(settings_.cache_capacity);
    std::string error;
    if (!cache->open(settings_.cache_dir, error))
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Cache, "Translation cache disabled", error);
        return;
    }
    cache_ = std::move(cache);
}

void Application::recordFailure(const std::string& message)
{
    std::lock_guard<std::mutex> lk(failures_mutex_);
    failures_.push_back(message);
}

std::string Application::displayPath(const fs::path& path) const
{
    const fs::path root(settings_.input);
    fs::path rel = path.lexically_relative(root);
    if (rel.empty() || rel == ".")
        rel = path.filename();
    return rel.generic_string();
}

Application::ParseResult Application::parseCommandLineArgs()
{
    for (int i = 1; i < argc_; ++i)
    {
        std::string arg = argv_[i];
        std::string inline_value;
        bool has_inline = false;
        const auto eq = arg.find('=');
        if (arg.rfind("--", 0) == 0 && eq != std::string::npos)
        {
            inline_value = arg.substr(eq + 1);
            arg.erase(eq);
            has_inline = true;
        }

        auto value = [&](std::string& out) -> bool {
            if (has_inline)
            {
                out = inline_value;
                return true;
            }
            if (i + 1 >= argc_)
            {
                usage_error_ = "option " + arg + " requires a value";
                return false;
            }
            out = argv_[++i];
            return true;
        };
        auto int_value = [&](std::optional<int>& out) -> bool {
            std::string text;
            if (!value(text))
                return false;
            int parsed = 0;
            if (!parse_int(text, parsed))
            {
                usage_error_ = "option " + arg + " expects an integer, got '" + text + "'";
                return false;
            }
            out = parsed;
            return true;
        };
        auto list_value = [&](std::optional<std::vector<std::string>>& out) -> bool {
            std::string text;
            if (!value(text))
                return false;
            if (!out)
                out.emplace();
            for (auto& item : split_list(text))
                out->push_back(std::move(item));
            return true;
        };
        auto string_value = [&](std::optional<std::string>& out) -> bool {
            std::string text;
            if (!value(text))
                return false;
            out = std::move(text);
            return true;
        };

        const char* name = arg.c_str();
        bool ok = true;
        if (std::strcmp(name, "--help") == 0 || std::strcmp(name, "-h") == 0)
        {
            printUsage();
            return ParseResult::ExitOk;
        }
        else if (std::strcmp(name, "--version") == 0)
        {
            std::cout << "transfold " << TRANSFOLD_VERSION_STRING << "\n";
            return ParseResult::ExitOk;
        }
        else if (std::strcmp(name, "--config") == 0)
            ok = value(config_path_);
        else if (std::strcmp(name, "--env-file") == 0)
            ok = value(env_file_);
        else if (std::strcmp(name, "--input") == 0)
            ok = string_value(cli_.input);
        else if (std::strcmp(name, "--output") == 0)
            ok = string_value(cli_.output);
        else if (std::strcmp(name, "--ext") == 0)
            ok = list_value(cli_.extensions);
        else if (std::strcmp(name, "--target-lang") == 0)
            ok = string_value(cli_.target_lang);
        else if (std::strcmp(name, "--source-lang") == 0)
            ok = string_value(cli_.source_lang);
        else if (std::strcmp(name, "--backend") == 0)
            ok = string_value(cli_.backend);
        else if (std::strcmp(name, "--base-url") == 0)
            ok = string_value(cli_.base_url);
        else if (std::strcmp(name, "--model") == 0)
            ok = string_value(cli_.model);
        else if (std::strcmp(name, "--api-key") == 0)
            ok = string_value(cli_.api_key);
        else if (std::strcmp(name, "--system-prompt") == 0)
            ok = string_value(cli_.system_prompt);
        else if (std::strcmp(name, "--glossary") == 0)
            ok = string_value(cli_.glossary);
        else if (std::strcmp(name, "--concurrency") == 0)
            ok = int_value(cli_.concurrency);
        else if (std::strcmp(name, "--max-pending-batches") == 0)
            ok = int_value(cli_.max_pending_batches);
        else if (std::strcmp(name, "--retry") == 0)
            ok = int_value(cli_.retry);
        else if (std::strcmp(name, "--timeout") == 0)
        {
            std::string text;
            double parsed = 0.0;
            ok = value(text);
            if (ok && !parse_double(text, parsed))
            {
                usage_error_ = "option --timeout expects a number, got '" + text + "'";
                ok = false;
            }
            if (ok)
                cli_.timeout = parsed;
        }
        else if (std::strcmp(name, "--batch-chars") == 0)
            ok = int_value(cli_.batch_chars);
        else if (std::strcmp(name, "--batch-segments") == 0)
            ok = int_value(cli_.batch_segments);
        else if (std::strcmp(name, "--include") == 0)
            ok = list_value(cli_.include);
        else if (std::strcmp(name, "--exclude") == 0)
            ok = list_value(cli_.exclude);
        else if (std::strcmp(name, "--max-chars") == 0)
            ok = int_value(cli_.max_chars);
        else if (std::strcmp(name, "--split-threshold") == 0)
            ok = string_value(cli_.split_threshold);
        else if (std::strcmp(name, "--chunk-strategy") == 0)
            ok = string_value(cli_.chunk_strategy);
        else if (std::strcmp(name, "--translate-code") == 0)
            cli_.translate_code = true;
        else if (std::strcmp(name, "--no-translate-code") == 0)
            cli_.translate_code = false;
        else if (std::strcmp(name, "--translate-frontmatter") == 0)
            cli_.translate_frontmatter = true;
        else if (std::strcmp(name, "--no-translate-frontmatter") == 0)
            cli_.translate_frontmatter = false;
        else if (std::strcmp(name, "--stream-writes") == 0)
            cli_.stream_writes = true;
        else if (std::strcmp(name, "--no-stream-writes") == 0)
            cli_.stream_writes = false;
        else if (std::strcmp(name, "--no-backup") == 0 || std::strcmp(name, "--overwrite") == 0)
            cli_.backup = false;
        else if (std::strcmp(name, "--cache-dir") == 0)
        {
            ok = string_value(cli_.cache_dir);
            if (ok)
                cli_.cache_enabled = true;
        }
        else if (std::strcmp(name, "--dry-run") == 0)
            cli_.dry_run = true;
        else if (std::strcmp(name, "--check") == 0)
            cli_.check = true;
        else if (std::strcmp(name, "--debug") == 0)
            cli_.debug = true;
        else
        {
            usage_error_ = "unknown option " + arg;
            ok = false;
        }

        if (!ok)
            return ParseResult::Error;
    }
    return ParseResult::Continue;
}

void Application::printUsage()
{
    std::cout << "Usage: transfold --input PATH --target-lang LANG [options]\n"
                 "\n"
                 "Translate Markdown documents through an OpenAI-compatible chat completions API.\n"
                 "\n"
                 "Input and output:\n"
                 "  --input PATH                 File or directory to translate\n"
                 "  --output DIR                 Mirror translated files here instead of in place\n"
                 "  --ext LIST                   File extensions to include (default: md)\n"
                 "  --include GLOB               Only translate matching relative paths (repeatable)\n"
                 "  --exclude GLOB               Skip matching relative paths (repeatable)\n"
                 "  --no-backup, --overwrite     Do not keep .bak copies of replaced files\n"
                 "  --stream-writes              Write each finished prefix as soon as it is ready\n"
                 "  --dry-run                    Segment files and print counts without translating\n"
                 "\n"
                 "Translation:\n"
                 "  --target-lang LANG           Target language code\n"
                 "  --source-lang LANG           Source language code or 'auto' (default)\n"
                 "  --backend NAME               openrouter (default) or openai\n"
                 "  --base-url URL               Chat completions endpoint\n"
                 "  --model NAME                 Model identifier (default: openrouter/auto)\n"
                 "  --api-key KEY                API key (or OPENROUTER_API_KEY)\n"
                 "  --glossary FILE              JSON or CSV term list added to the prompt\n"
                 "  --system-prompt TEXT         Replace the built-in system prompt\n"
                 "  --concurrency N              Simultaneous requests and document workers\n"
                 "  --max-pending-batches N      Batches in flight per document (default: 2 x concurrency)\n"
                 "  --batch-chars N              Characters per request (default: 16000)\n"
                 "  --batch-segments N           Segments per request (default: 6)\n"
                 "  --retry N                    Attempts per request (default: 3)\n"
                 "  --timeout SECONDS            Request timeout (default: 60)\n"
                 "  --cache-dir DIR              Reuse translations stored in DIR\n"
                 "\n"
                 "Segmentation:\n"
                 "  --max-chars N                Characters per segment (default: 4000)\n"
                 "  --split-threshold N          Keep documents up to N characters whole\n"
                 "  --chunk-strategy NAME        Segmentation strategy (default: markdown)\n"
                 "  --[no-]translate-code        Translate fenced code blocks\n"
                 "  --[no-]translate-frontmatter Translate YAML front matter\n"
                 "\n"
                 "General:\n"
                 "  --config FILE                TOML config file (default: transfold.toml)\n"
                 "  --env-file FILE              Load KEY=VALUE pairs into the environment\n"
                 "  --check                      Test the connection to the translation service\n"
                 "  --debug                      Log request details\n"
                 "  --version                    Print version\n"
                 "  -h, --help                   Show this help\n";
}
