#ifndef SASMETRICS_UTILS_FILESYSTEM_HPP
#define SASMETRICS_UTILS_FILESYSTEM_HPP

#pragma once

#include <string>
#include <vector>

namespace sasmetrics::utils {

// File reading operations
std::string read_file_content(const std::string &file_path);

//  Directory operations
std::vector<std::string> list_files(const std::string &directory_path, bool recursive = false);

// Extension check without the dot, case-insensitive ("sas" matches "X.SAS")
bool has_extension(const std::string &file_path, const std::string &extension);

// Pattern matching
bool matches_pattern(const std::string &text, const std::string &pattern);

// Path operations
std::string normalize_path(const std::string &path);

} // namespace sasmetrics::utils

#endif // SASMETRICS_UTILS_FILESYSTEM_HPP
