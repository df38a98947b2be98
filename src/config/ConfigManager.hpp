#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <toml++/toml.h>

struct TableCallbacks
{
    std::function<void(const toml::table& section)> load;
};

// Reads the TOML config file once and hands each registered section to its owner.
// Keys inside a registered section that nobody owns or reserves are reported as
// unknown, which catches misspelled section names early.
class ConfigManager
{
public:
    explicit ConfigManager(std::string config_path = "transfold.toml");
    ~ConfigManager();

    bool registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys);

    // Keys read by someone else (the logging setup reads [global] and [app]).
    void reserveKeys(const std::string& path, std::vector<std::string> keys);

    // A missing file is not an error; every handler then sees an empty table.
    bool load();
    const toml::table& root() const;

    const std::string& path() const { return config_path_; }
    bool fileFound() const { return file_found_; }
    const char* lastError() const { return last_error_.c_str(); }
    const std::vector<std::string>& unknownKeys() const { return unknown_keys_; }

private:
    struct HandlerEntry
    {
        std::string path;
        TableCallbacks callbacks;
        std::vector<std::string> ownedKeys;
    };

    const toml::table* resolveTablePath(const toml::table& root, const std::string& path) const;
    bool isKnownKey(const std::string& path, const std::string& key) const;
    void collectUnknownKeys();

    std::string config_path_;
    std::string last_error_;
    bool file_found_ = false;

    std::vector<HandlerEntry> handlers_;
    std::vector<std::pair<std::string, std::string>> reserved_;
    std::vector<std::string> unknown_keys_;
    std::unique_ptr<toml::table> root_;
};
