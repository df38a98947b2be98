#include "SettingsSerializer.hpp"
#include "AppSettings.hpp"
#include "SettingsResolver.hpp"

#include <plog/Log.h>

#include <cstdint>

namespace
{

std::optional<bool> read_bool(const toml::node_view<const toml::node>& node)
{
    if (auto v = node.value<bool>())
        return *v;
    if (auto s = node.value<std::string>())
    {
        bool parsed = false;
        if (parse_bool(*s, parsed))
            return parsed;
        PLOG_WARNING << "Ignoring non-boolean config value '" << *s << "'";
    }
    return std::nullopt;
}

std::optional<int> read_int(const toml::node_view<const toml::node>& node)
{
    if (auto v = node.value<std::int64_t>())
        return static_cast<int>(*v);
    if (auto s = node.value<std::string>())
    {
        int parsed = 0;
        if (parse_int(*s, parsed))
            return parsed;
        PLOG_WARNING << "Ignoring non-integer config value '" << *s << "'";
    }
    return std::nullopt;
}

// Accepts either an array of strings or one comma separated string.
std::optional<std::vector<std::string>> read_list(const toml::node_view<const toml::node>& node)
{
    if (auto s = node.value<std::string>())
        return split_list(*s);
    if (auto* arr = node.as_array())
    {
        std::vector<std::string> out;
        for (const auto& item : *arr)
        {
            if (auto s = item.value<std::string>())
            {
                for (auto& part : split_list(*s))
                    out.push_back(std::move(part));
            }
        }
        return out;
    }
    return std::nullopt;
}

void assign(std::optional<std::string>& dst, const toml::node_view<const toml::node>& node)
{
    if (auto v = node.value<std::string>())
        dst = *v;
}

} // namespace

void SettingsSerializer::deserialize(const toml::table& root, SettingsLayer& layer)
{
    if (auto* t = root["translation"].as_table())
    {
        const toml::table& trans = *t;
        assign(layer.backend, trans["backend"]);
        assign(layer.base_url, trans["base_url"]);
        assign(layer.model, trans["model"]);
        assign(layer.api_key, trans["api_key"]);
        assign(layer.target_lang, trans["target_lang"]);
        assign(layer.source_lang, trans["source_lang"]);
        assign(layer.system_prompt, trans["system_prompt"]);
        assign(layer.glossary, trans["glossary"]);
        if (auto v = read_int(trans["concurrency"]))
            layer.concurrency = *v;
        if (auto v = read_int(trans["max_pending_batches"]))
            layer.max_pending_batches = *v;
        if (auto v = read_int(trans["retry"]))
            layer.retry = *v;
        if (auto v = trans["timeout"].value<double>())
            layer.timeout = *v;
    }

    if (auto* t = root["batch"].as_table())
    {
        const toml::table& batch = *t;
        if (auto v = read_int(batch["chars"]))
            layer.batch_chars = *v;
        if (auto v = read_int(batch["segments"]))
            layer.batch_segments = *v;
    }

    if (auto* t = root["chunk"].as_table())
    {
        const toml::table& chunk = *t;
        assign(layer.chunk_strategy, chunk["strategy"]);
        if (auto v = read_int(chunk["max_chars"]))
            layer.max_chars = *v;
        if (auto v = chunk["split_threshold"].value<std::int64_t>())
            layer.split_threshold = std::to_string(*v);
        else
            assign(layer.split_threshold, chunk["split_threshold"]);
        if (auto v = read_bool(chunk["translate_code"]))
            layer.translate_code = *v;
        if (auto v = read_bool(chunk["translate_frontmatter"]))
            layer.translate_frontmatter = *v;
    }

    if (auto* t = root["files"].as_table())
    {
        const toml::table& files = *t;
        assign(layer.input, files["input"]);
        assign(layer.output, files["output"]);
        if (auto v = read_list(files["ext"]))
            layer.extensions = std::move(*v);
        if (auto v = read_list(files["include"]))
            layer.include = std::move(*v);
        if (auto v = read_list(files["exclude"]))
            layer.exclude = std::move(*v);
        if (auto v = read_bool(files["backup"]))
            layer.backup = *v;
        if (auto v = read_bool(files["stream_writes"]))
            layer.stream_writes = *v;
    }

    if (auto* t = root["cache"].as_table())
    {
        const toml::table& cache = *t;
        if (auto v = read_bool(cache["enabled"]))
            layer.cache_enabled = *v;
        assign(layer.cache_dir, cache["dir"]);
        if (auto v = read_int(cache["capacity"]))
            layer.cache_capacity = *v;
    }
}
