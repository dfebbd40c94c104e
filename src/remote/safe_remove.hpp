#pragma once

#include <string>
#include <filesystem>
#include "shell.hpp"

// Recursive remove on the target, restricted to a cache root.
//
// Refuses (CpConfigError, no network I/O) unless `path` is non-empty,
// absolute, not "/", and either equal to `target_root` or below it.
class SafeRemove {
public:
    explicit SafeRemove(Shell& shell);

    // Returns true if the shell reported success.
    bool remove_path(const std::string& path, const std::filesystem::path& target_root);

    // Precondition check only; throws CpConfigError on violation.
    static void validate(const std::string& path, const std::filesystem::path& target_root);

private:
    Shell& shell_;
};
