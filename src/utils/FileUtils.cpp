#include "FileUtils.hpp"
#include "../processing/TextUtils.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <fnmatch.h>
#include <fstream>
#include <iterator>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;

namespace utils
{

namespace
{

std::string lower_copy(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string normalize_extension(const std::string& ext)
{
    std::size_t start = 0;
    while (start < ext.size() && ext[start] == '.')
        ++start;
    return lower_copy(ext.substr(start));
}

bool matches_any(const std::string& rel, const std::vector<std::string>& patterns)
{
    for (const auto& pattern : patterns)
    {
        // No FNM_PATHNAME: '*' also crosses directory separators.
        if (::fnmatch(pattern.c_str(), rel.c_str(), 0) == 0)
            return true;
    }
    return false;
}

std::string trim_copy(const std::string& value)
{
    std::size_t begin = 0;
    std::size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin])))
        ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1])))
        --end;
    return value.substr(begin, end - begin);
}

// RFC 4180 style row split: quoted fields, doubled quotes, commas inside quotes.
std::vector<std::string> split_csv_row(const std::string& line)
{
    std::vector<std::string> fields;
    std::string current;
    bool quoted = false;
    for (std::size_t i = 0; i < line.size(); ++i)
    {
        const char c = line[i];
        if (quoted)
        {
            if (c == '"')
            {
                if (i + 1 < line.size() && line[i + 1] == '"')
                {
                    current.push_back('"');
                    ++i;
                }
                else
                {
                    quoted = false;
                }
            }
            else
            {
                current.push_back(c);
            }
        }
        else if (c == '"')
        {
            quoted = true;
        }
        else if (c == ',')
        {
            fields.push_back(std::move(current));
            current.clear();
        }
        else if (c != '\r')
        {
            current.push_back(c);
        }
    }
    fields.push_back(std::move(current));
    return fields;
}

fs::path temp_path_for(const fs::path& path)
{
    static std::atomic<unsigned long long> counter{ 0 };
    std::ostringstream name;
    name << '.' << path.filename().string() << '.' << std::hash<std::thread::id>{}(std::this_thread::get_id())
         << '.' << counter.fetch_add(1, std::memory_order_relaxed) << ".tmp";
    return path.parent_path() / name.str();
}

} // namespace

std::vector<fs::path> gather_files(const fs::path& root, const std::vector<std::string>& extensions,
                                   const std::vector<std::string>& include, const std::vector<std::string>& exclude)
{
    std::vector<std::string> exts;
    for (const auto& ext : extensions)
    {
        auto normalized = normalize_extension(ext);
        if (!normalized.empty())
            exts.push_back(std::move(normalized));
    }

    std::vector<fs::path> files;
    std::error_code ec;
    if (fs::is_regular_file(root, ec))
    {
        files.push_back(root);
        return files;
    }

    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec)
    {
        PLOG_WARNING << "Cannot scan " << root.string() << ": " << ec.message();
        return files;
    }

    const fs::recursive_directory_iterator end{};
    for (; it != end; it.increment(ec))
    {
        if (ec)
        {
            PLOG_WARNING << "Directory scan stopped early under " << root.string() << ": " << ec.message();
            break;
        }
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec))
            continue;

        const fs::path& path = it->path();
        if (!exts.empty())
        {
            const auto suffix = normalize_extension(path.extension().string());
            if (std::find(exts.begin(), exts.end(), suffix) == exts.end())
                continue;
        }

        const std::string rel = path.lexically_relative(root).generic_string();
        if (!include.empty() && !matches_any(rel, include))
            continue;
        if (!exclude.empty() && matches_any(rel, exclude))
            continue;
        files.push_back(path);
    }

    std::sort(files.begin(), files.end());
    return files;
}

bool read_text(const fs::path& path, std::string& out_text, std::string& out_error)
{
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
    {
        out_error = "Failed to read " + path.string();
        return false;
    }

    std::string data((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if (ifs.bad())
    {
        out_error = "Failed to read " + path.string();
        return false;
    }
    if (data.find('\0') != std::string::npos)
    {
        out_error = path.string() + " appears to be a binary file; skipping";
        return false;
    }
    if (!processing::isValidUtf8(data))
    {
        out_error = path.string() + " is not valid UTF-8";
        return false;
    }

    out_text = std::move(data);
    return true;
}

bool ensure_parent(const fs::path& path, std::string& out_error)
{
    const auto parent = path.parent_path();
    if (parent.empty())
        return true;

    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec)
    {
        out_error = "Cannot create directory " + parent.string() + ": " + ec.message();
        return false;
    }
    return true;
}

fs::path backup_path_for(const fs::path& path)
{
    fs::path backup = path;
    backup += ".bak";
    return backup;
}

bool atomic_write(const fs::path& path, const std::string& content, bool backup, std::string& out_error)
{
    if (!ensure_parent(path, out_error))
        return false;

    const fs::path tmp = temp_path_for(path);
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs)
        {
            out_error = "Cannot create temporary file " + tmp.string();
            return false;
        }
        ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
        ofs.flush();
        if (!ofs)
        {
            out_error = "Failed to write temporary file " + tmp.string();
            std::error_code ignored;
            fs::remove(tmp, ignored);
            return false;
        }
    }

    try
    {
        if (backup && fs::exists(path))
        {
            fs::copy_file(path, backup_path_for(path), fs::copy_options::overwrite_existing);
            PLOG_DEBUG << "Backed up: " << path.string();
        }
        fs::rename(tmp, path);
        return true;
    }
    catch (const fs::filesystem_error& e)
    {
        out_error = std::string("Filesystem error: ") + e.what();
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return false;
    }
}

bool append_text(const fs::path& path, const std::string& content, std::string& out_error)
{
    if (!ensure_parent(path, out_error))
        return false;

    std::ofstream ofs(path, std::ios::binary | std::ios::app);
    if (!ofs)
    {
        out_error = "Cannot open " + path.string() + " for appending";
        return false;
    }
    ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
    ofs.flush();
    if (!ofs)
    {
        out_error = "Failed to append to " + path.string();
        return false;
    }
    return true;
}

bool read_glossary(const fs::path& path, Glossary& out, std::string& out_error)
{
    const auto suffix = lower_copy(path.extension().string());
    if (suffix != ".json" && suffix != ".csv")
    {
        out_error = "Unsupported glossary format: " + path.extension().string();
        return false;
    }

    std::string text;
    if (!read_text(path, text, out_error))
        return false;

    if (suffix == ".json")
    {
        try
        {
            auto json = nlohmann::json::parse(text);
            if (!json.is_object())
            {
                out_error = "Glossary JSON must be an object of source -> target terms";
                return false;
            }
            for (auto it = json.begin(); it != json.end(); ++it)
            {
                if (it.value().is_string())
                    out[it.key()] = it.value().get<std::string>();
                else
                    out[it.key()] = it.value().dump();
            }
            return true;
        }
        catch (const nlohmann::json::exception& ex)
        {
            out_error = std::string("Glossary parse error: ") + ex.what();
            return false;
        }
    }

    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line))
    {
        const auto fields = split_csv_row(line);
        if (fields.size() >= 2)
            out[trim_copy(fields[0])] = trim_copy(fields[1]);
    }
    return true;
}

} // namespace utils
