#pragma once

#include <string>
#include <core/types.hpp>
#include "shell.hpp"

enum class RemoteNodeKind { Missing, File, Directory };

// File-type questions about the target, one `test` round trip each.
// Exit 0 is true, exit 1 is false; anything else is a transport error.
class RemoteProbe {
public:
    explicit RemoteProbe(Shell& shell);

    Result<bool> is_dir(const std::string& path);
    Result<bool> is_file(const std::string& path);
    Result<bool> exists(const std::string& path);

    // Directory, then file. Two round trips at most.
    Result<RemoteNodeKind> kind(const std::string& path);

private:
    Shell& shell_;

    Result<bool> test(const char* flag, const std::string& path);
};
