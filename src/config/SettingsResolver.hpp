#pragma once

#include <string>
#include <vector>

struct AppSettings;
struct SettingsLayer;

// "true/1/yes/on" and "false/0/no/off", case-insensitive.
bool parse_bool(const std::string& text, bool& out);
bool parse_int(const std::string& text, int& out);
bool parse_double(const std::string& text, double& out);

// Splits on commas and drops empty items.
std::vector<std::string> split_list(const std::string& text);

// KEY=VALUE lines; blank lines and '#' comments are skipped, surrounding quotes removed.
// Variables already present in the environment are left alone.
bool load_env_file(const std::string& path, std::string& error);

SettingsLayer settings_from_environment();

// Precedence: command line, then config file, then environment, then defaults.
bool resolve_settings(const SettingsLayer& cli, const SettingsLayer& file, const SettingsLayer& env,
                      AppSettings& out, std::string& error);
