#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <fstream>
#include <set>
#include <sstream>

ConfigManager::ConfigManager(std::string config_path)
    : config_path_(std::move(config_path))
{
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys)
{
    for (const auto& key : ownedKeys)
    {
        if (isKnownKey(path, key))
        {
            last_error_ = "Duplicate ownership: key '" + key + "' at path '" + path + "' already registered";
            PLOG_ERROR << last_error_;
            return false;
        }
    }

    handlers_.push_back({ path, std::move(cb), std::move(ownedKeys) });
    return true;
}

void ConfigManager::reserveKeys(const std::string& path, std::vector<std::string> keys)
{
    for (auto& key : keys)
        reserved_.emplace_back(path, std::move(key));
}

bool ConfigManager::load()
{
    last_error_.clear();
    unknown_keys_.clear();
    file_found_ = false;
    root_ = std::make_unique<toml::table>();

    std::ifstream ifs(config_path_, std::ios::binary);
    if (ifs)
    {
        file_found_ = true;
        try
        {
            *root_ = toml::parse(ifs, config_path_);
        }
        catch (const toml::parse_error& pe)
        {
            const auto line = pe.source().begin.line;
            last_error_ = "config parse error";
            if (line > 0)
                last_error_ += " at line " + std::to_string(line);
            last_error_ += ": " + std::string(pe.description());
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Configuration file has errors",
                                              last_error_ + " (" + config_path_ + ")");
            return false;
        }
        PLOG_INFO << "Loaded config from " << config_path_;
        collectUnknownKeys();
    }
    else
    {
        PLOG_DEBUG << "No config file at " << config_path_ << ", using defaults";
    }

    const toml::table empty;
    for (const auto& handler : handlers_)
    {
        const toml::table* section = resolveTablePath(*root_, handler.path);
        handler.callbacks.load(section ? *section : empty);
    }
    return true;
}

const toml::table& ConfigManager::root() const
{
    static const toml::table empty;
    return root_ ? *root_ : empty;
}

bool ConfigManager::isKnownKey(const std::string& path, const std::string& key) const
{
    for (const auto& handler : handlers_)
    {
        if (handler.path == path &&
            std::find(handler.ownedKeys.begin(), handler.ownedKeys.end(), key) != handler.ownedKeys.end())
            return true;
    }
    return std::find(reserved_.begin(), reserved_.end(), std::make_pair(path, key)) != reserved_.end();
}

void ConfigManager::collectUnknownKeys()
{
    std::set<std::string> paths;
    for (const auto& handler : handlers_)
        paths.insert(handler.path);

    for (const auto& path : paths)
    {
        const toml::table* section = resolveTablePath(*root_, path);
        if (!section)
            continue;
        for (const auto& [key, value] : *section)
        {
            const std::string name(key.str());
            if (isKnownKey(path, name))
                continue;
            const std::string full = path.empty() ? name : path + "." + name;
            unknown_keys_.push_back(full);
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                                "Unknown configuration key '" + full + "' ignored", config_path_);
        }
    }
}

const toml::table* ConfigManager::resolveTablePath(const toml::table& root, const std::string& path) const
{
    if (path.empty())
        return &root;

    std::istringstream ss(path);
    std::string segment;
    const toml::table* current = &root;

    while (std::getline(ss, segment, '.'))
    {
        if (segment.empty())
        {
            PLOG_WARNING << "Invalid config path: " << path;
            return nullptr;
        }

        auto* tbl = current->get_as<toml::table>(segment);
        if (!tbl)
            return nullptr;
        current = tbl;
    }

    return current;
}
