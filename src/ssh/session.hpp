#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

// One authenticated libssh2 session to a target. Channels are opened per
// command by SSHConnection.
class SessionManager {
public:
    explicit SessionManager(const TargetConfig& target);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    SSHResult establish(StatusCallback callback = nullptr);
    void close();

    LIBSSH2_SESSION* get_raw_session() { return session_; }
    const std::string& get_target() const { return target_str_; }
    std::shared_ptr<std::mutex> io_mutex() { return io_mutex_; }

private:
    TargetConfig target_;
    LIBSSH2_SESSION* session_;
    int sock_;
    std::string target_str_;
    std::shared_ptr<std::mutex> io_mutex_;

    SSHResult establish_connection(StatusCallback callback);
    SSHResult ssh_userauth(StatusCallback callback);
    void teardown(const char* reason);
    std::string last_error() const;
};
