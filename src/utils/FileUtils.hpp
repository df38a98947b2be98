#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace utils
{

using Glossary = std::map<std::string, std::string>;

/// Recursively collect regular files under root, sorted by relative path.
/// extensions are matched case-insensitively without the leading dot; empty accepts all.
/// include/exclude are fnmatch-style patterns applied to the POSIX relative path.
std::vector<std::filesystem::path> gather_files(const std::filesystem::path& root,
                                                const std::vector<std::string>& extensions,
                                                const std::vector<std::string>& include,
                                                const std::vector<std::string>& exclude);

/// Reads a whole file as UTF-8 text. Binary files (NUL bytes) and invalid UTF-8 are rejected.
bool read_text(const std::filesystem::path& path, std::string& out_text, std::string& out_error);

bool ensure_parent(const std::filesystem::path& path, std::string& out_error);

/// Writes content to a sibling temporary file and renames it over path.
/// With backup set and path present, the previous file is copied to "<path>.bak" first.
bool atomic_write(const std::filesystem::path& path, const std::string& content, bool backup,
                  std::string& out_error);

/// Appends content, creating the file if needed.
bool append_text(const std::filesystem::path& path, const std::string& content, std::string& out_error);

/// Loads a term mapping from a JSON object or a CSV file with at least two columns.
bool read_glossary(const std::filesystem::path& path, Glossary& out, std::string& out_error);

std::filesystem::path backup_path_for(const std::filesystem::path& path);

} // namespace utils
