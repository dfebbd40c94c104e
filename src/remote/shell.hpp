#pragma once

#include <string>
#include <core/types.hpp>

// The only two primitives the cache client needs from a target.
// Implementations report transport failures as exit_code -1 with the reason
// in stderr_data; they never throw for them.
class Shell {
public:
    virtual ~Shell() = default;

    // Run a command through the target's shell.
    virtual SSHResult exec_cmd(const std::string& command) = 0;

    // Copy a local file to `remote_path`, creating parent directories first
    // when `makedirs` is set.
    virtual SSHResult send(const std::string& local_path,
                           const std::string& remote_path,
                           bool makedirs) = 0;
};
