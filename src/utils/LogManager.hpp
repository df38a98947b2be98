#pragma once

#include <plog/Severity.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace plog
{
class IAppender;
}

namespace utils
{

// Sets up the run's plog loggers: one rolling file per registered instance, plus a
// shared console logger chained into them with its own severity.
class LogManager
{
public:
    struct LoggerConfig
    {
        std::string name;
        // Relative names are placed under the log directory.
        std::string filename;
        std::optional<bool> append_override;
        std::optional<plog::Severity> level_override;
        size_t max_file_size = 10 * 1024 * 1024;
        size_t backup_count = 3;
        // Mirror records at or above this severity to stderr.
        std::optional<plog::Severity> console_level;
    };

    static constexpr int kConsoleInstance = 1;

    // Reads [global] and [app.debug] from config_path before any logger exists.
    static bool Initialize(const std::string& config_path = "transfold.toml");

    template <int InstanceId = 0>
    static bool RegisterLogger(const LoggerConfig& config);

    static void Shutdown();

    static bool IsAppendMode();
    static plog::Severity GetDefaultLogLevel();
    static void SetLogLevel(plog::Severity level);
    static void SetConsoleLevel(plog::Severity level);

    static const std::filesystem::path& LogDirectory();
    static std::filesystem::path LogPath(const std::string& filename);

private:
    LogManager() = default;

    static bool ReadConfig(const std::string& config_path);
    static bool PrepareLogDirectory();
    static plog::IAppender* ConsoleLogger(plog::Severity level);

    static bool s_initialized;
    static bool s_append_logs;
    static plog::Severity s_default_level;
    static std::filesystem::path s_log_dir;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
