#include "utils.hpp"
#include <platform/platform.hpp>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace fs = std::filesystem;

static bool is_shell_safe(char c) {
    if (c >= 'a' && c <= 'z') return true;
    if (c >= 'A' && c <= 'Z') return true;
    if (c >= '0' && c <= '9') return true;
    switch (c) {
        case '@': case '%': case '+': case '=': case ':':
        case ',': case '.': case '/': case '_': case '-':
            return true;
        default:
            return false;
    }
}

std::string shell_quote(const std::string& s) {
    if (s.empty()) return "''";

    bool safe = true;
    for (char c : s) {
        if (!is_shell_safe(c)) { safe = false; break; }
    }
    if (safe) return s;

    // 'it'"'"'s' style: close, escaped quote, reopen
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\"'\"'";
        else out += c;
    }
    out += "'";
    return out;
}

std::string expand_user(const std::string& path) {
    if (path == "~") return platform::home_dir().string();
    if (path.rfind("~/", 0) == 0) {
        return (platform::home_dir() / path.substr(2)).string();
    }
    return path;
}

static fs::path normalized(const fs::path& p) {
    auto n = p.lexically_normal();
    // "/a/b/" normalises to "/a/b/" (trailing empty element); drop it
    if (!n.empty() && n.filename().empty() && n != n.root_path()) {
        n = n.parent_path();
    }
    return n;
}

bool path_strictly_within(const fs::path& path, const fs::path& root) {
    fs::path p = normalized(path);
    fs::path r = normalized(root);
    if (p == r) return false;

    auto pit = p.begin();
    for (auto rit = r.begin(); rit != r.end(); ++rit, ++pit) {
        if (pit == p.end() || *pit != *rit) return false;
    }
    return pit != p.end();
}

bool path_within(const fs::path& path, const fs::path& root) {
    return normalized(path) == normalized(root) || path_strictly_within(path, root);
}

std::string read_file_bytes(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot read file: " + path.string());
    }
    return std::string((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
}
