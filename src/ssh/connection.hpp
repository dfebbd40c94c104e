#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>
#include <remote/shell.hpp>

class SessionManager;

// Shell over an established session. Every call opens its own exec channel
// (no PTY), so stdout, stderr and the exit status come back separately.
class SSHConnection : public Shell {
public:
    explicit SSHConnection(SessionManager& session, int timeout_secs = 0);

    SSHResult exec_cmd(const std::string& command) override;

    // `cat > remote` with the file piped to stdin; `mkdir -p` the parent first
    // when makedirs is set.
    SSHResult send(const std::string& local_path,
                   const std::string& remote_path,
                   bool makedirs) override;

    // Execute a command on a new exec channel and pipe binary data to its stdin.
    SSHResult run_with_input(const std::string& command,
                             const char* data, size_t data_len,
                             int timeout_secs = 0);

private:
    SessionManager& session_mgr_;
    std::shared_ptr<std::mutex> io_mutex_;
    int timeout_secs_;
};
