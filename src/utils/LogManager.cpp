#include "LogManager.hpp"
#include "ErrorReporter.hpp"

#include <fstream>

#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/MessageOnlyFormatter.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>
#include <toml++/toml.h>

namespace fs = std::filesystem;

namespace utils
{

bool LogManager::s_initialized = false;
bool LogManager::s_append_logs = true;
plog::Severity LogManager::s_default_level = plog::info;
fs::path LogManager::s_log_dir = "logs";
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(const std::string& config_path)
{
    if (s_initialized)
        return true;

    if (!ReadConfig(config_path))
        return false;

    // File loggers are skipped without a directory; the console still works.
    if (!PrepareLogDirectory())
        s_log_dir.clear();

    s_initialized = true;
    return true;
}

template <int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    static_assert(InstanceId != kConsoleInstance, "instance id is reserved for the console logger");

    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization,
                                   "LogManager not initialized before registering logger", config.name);
        return false;
    }

    const plog::Severity level = config.level_override.value_or(s_default_level);

    try
    {
        if (s_log_dir.empty())
        {
            // plog needs at least one appender to create the instance.
            if (!config.console_level)
                return false;
            plog::init<InstanceId>(level, ConsoleLogger(*config.console_level));
            return true;
        }

        const fs::path file = LogPath(config.filename);
        if (!config.append_override.value_or(s_append_logs))
            std::ofstream(file, std::ios::trunc).close();

        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            file.string().c_str(), config.max_file_size, static_cast<int>(config.backup_count));

        auto& logger = plog::init<InstanceId>(level, file_appender.get());
        s_appenders.push_back(std::move(file_appender));

        if (config.console_level)
            logger.addAppender(ConsoleLogger(*config.console_level));
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to register logger: " + config.name,
                                   ex.what());
        return false;
    }
}

template bool LogManager::RegisterLogger<0>(const LoggerConfig&);

plog::IAppender* LogManager::ConsoleLogger(plog::Severity level)
{
    if (auto* existing = plog::get<kConsoleInstance>())
        return existing;

    auto console = std::make_unique<plog::ConsoleAppender<plog::MessageOnlyFormatter>>(plog::streamStdErr);
    auto& logger = plog::init<kConsoleInstance>(level, console.get());
    s_appenders.push_back(std::move(console));
    return &logger;
}

void LogManager::Shutdown()
{
    if (auto* logger = plog::get())
        logger->setMaxSeverity(plog::none);
    if (auto* console = plog::get<kConsoleInstance>())
        console->setMaxSeverity(plog::none);
    s_initialized = false;
}

bool LogManager::IsAppendMode() { return s_append_logs; }

plog::Severity LogManager::GetDefaultLogLevel() { return s_default_level; }

void LogManager::SetLogLevel(plog::Severity level)
{
    s_default_level = level;
    if (auto* logger = plog::get())
        logger->setMaxSeverity(level);
}

void LogManager::SetConsoleLevel(plog::Severity level)
{
    if (auto* console = plog::get<kConsoleInstance>())
        console->setMaxSeverity(level);
}

const fs::path& LogManager::LogDirectory() { return s_log_dir; }

fs::path LogManager::LogPath(const std::string& filename)
{
    const fs::path name(filename);
    if (name.is_absolute() || s_log_dir.empty())
        return name;
    return s_log_dir / name;
}

bool LogManager::PrepareLogDirectory()
{
    std::error_code ec;
    fs::create_directories(s_log_dir, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization,
                                     "Unable to prepare log directory " + s_log_dir.string(), ec.message());
        return false;
    }
    return true;
}

bool LogManager::ReadConfig(const std::string& config_path)
{
    std::error_code ec;
    if (!fs::exists(config_path, ec))
        return true;

    try
    {
        auto cfg = toml::parse_file(config_path);
        if (auto global = cfg["global"].as_table())
        {
            if (auto append = (*global)["append_logs"].value<bool>())
                s_append_logs = *append;
            if (auto dir = (*global)["log_dir"].value<std::string>(); dir && !dir->empty())
                s_log_dir = *dir;
        }

        if (auto level = cfg["app"]["debug"]["logging_level"].value<int64_t>())
        {
            if (*level >= plog::none && *level <= plog::verbose)
                s_default_level = static_cast<plog::Severity>(*level);
        }
        return true;
    }
    catch (const toml::parse_error& pe)
    {
        // ConfigManager reports the same file with line information later on.
        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Logging settings ignored",
                                     std::string(pe.description()));
        return true;
    }
}

} // namespace utils
