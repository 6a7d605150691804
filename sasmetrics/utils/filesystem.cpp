#include "utils/filesystem.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace sasmetrics::utils {

namespace fs = std::filesystem;

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

} // namespace

std::string read_file_content(const std::string &file_path) {
    std::ifstream file(file_path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + file_path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw std::runtime_error("Failed to read file: " + file_path);
    }
    return buffer.str();
}

std::vector<std::string> list_files(const std::string& dir_path, bool recursive) {
    std::vector<std::string> files;
    try {
        if (recursive) {
            for (const auto &entry : fs::recursive_directory_iterator(dir_path)) {
                if (entry.is_regular_file()) {
                    files.push_back(entry.path().string());
                }
            }
        } else {
            for (const auto &entry : fs::directory_iterator(dir_path)) {
                if (entry.is_regular_file()) {
                    files.push_back(entry.path().string());
                }
            }
        }
    } catch (const fs::filesystem_error &e) {
        throw std::runtime_error("Failed to list files in directory: " + dir_path + " (" + e.what() + ")");
    }

    std::sort(files.begin(), files.end());
    return files;
}

bool has_extension(const std::string &file_path, const std::string &extension) {
    std::string ext = fs::path(file_path).extension().string();
    if (ext.empty()) {
        return false;
    }
    if (ext[0] == '.') {
        ext = ext.substr(1);
    }
    return to_lower(ext) == to_lower(extension);
}

bool matches_pattern(const std::string &text, const std::string &pattern) {
    try {
        std::regex regex(pattern);
        return std::regex_search(text, regex);
    } catch (const std::regex_error &) {
        // If pattern is invalid, treat it as a simple string match
        return text.find(pattern) != std::string::npos;
    }
}

std::string normalize_path(const std::string &path) {
    return fs::path(path).lexically_normal().string();
}

} // namespace sasmetrics::utils
