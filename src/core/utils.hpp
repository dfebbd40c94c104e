#pragma once

#include <string>
#include <filesystem>

// Quote a string for a POSIX shell. Safe strings are returned unchanged.
std::string shell_quote(const std::string& s);

// Expand a leading "~/" to the user's home directory.
std::string expand_user(const std::string& path);

// True if `path` equals `root` or lies below it, after lexical normalisation.
bool path_within(const std::filesystem::path& path, const std::filesystem::path& root);

// True if `path` lies strictly below `root`, after lexical normalisation.
bool path_strictly_within(const std::filesystem::path& path, const std::filesystem::path& root);

// Read a whole file as bytes. Throws std::runtime_error if it cannot be opened.
std::string read_file_bytes(const std::filesystem::path& path);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
