#pragma once

#include "../config/AppSettings.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class ConfigManager;

namespace translate
{
class ITranslator;
}

namespace cache
{
class TranslationCache;
}

class Application
{
public:
    enum ExitCode
    {
        kExitOk = 0,
        kExitFailures = 1,
        kExitUsage = 2
    };

    Application(int argc, char** argv);
    ~Application();

    int run();

    const AppSettings& settings() const { return settings_; }

private:
    enum class ParseResult
    {
        Continue,
        ExitOk,
        Error
    };

    ParseResult parseCommandLineArgs();
    bool initializeLogging();
    bool loadSettings();

    int runDryRun(const std::vector<std::filesystem::path>& files);
    int runCheck();
    int runTranslation(const std::vector<std::filesystem::path>& files);

    bool createTranslator(std::string& error);
    void openCache();
    void recordFailure(const std::string& message);
    std::string displayPath(const std::filesystem::path& path) const;

    static void printUsage();

    int argc_ = 0;
    char** argv_ = nullptr;

    SettingsLayer cli_;
    std::string config_path_ = "transfold.toml";
    std::string env_file_;
    std::string usage_error_;

    AppSettings settings_;
    std::unique_ptr<ConfigManager> config_;
    std::unique_ptr<translate::ITranslator> translator_;
    std::unique_ptr<cache::TranslationCache> cache_;

    std::mutex failures_mutex_;
    std::vector<std::string> failures_;
    std::chrono::steady_clock::time_point start_time_;
};
