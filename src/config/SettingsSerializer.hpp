#pragma once

#include <toml++/toml.h>

struct SettingsLayer;

// TOML sections understood by the tool:
//   [translation] [batch] [chunk] [files] [cache]
// [global] and [app.debug] belong to utils::LogManager.
class SettingsSerializer
{
public:
    static void deserialize(const toml::table& root, SettingsLayer& layer);
};
