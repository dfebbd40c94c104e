#include "connection.hpp"
#include "session.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <thread>

namespace fs = std::filesystem;

SSHConnection::SSHConnection(SessionManager& session, int timeout_secs)
    : session_mgr_(session),
      io_mutex_(session.io_mutex()), timeout_secs_(timeout_secs) {
}

SSHResult SSHConnection::exec_cmd(const std::string& command) {
    auto r = run_with_input(command, nullptr, 0, timeout_secs_);
    sshcp_log_shell("exec", command, r);
    return r;
}

SSHResult SSHConnection::send(const std::string& local_path,
                              const std::string& remote_path,
                              bool makedirs) {
    std::string content;
    try {
        content = read_file_bytes(local_path);
    } catch (const std::exception& e) {
        return SSHResult{-1, "", e.what()};
    }

    std::string cmd = "cat > " + shell_quote(remote_path);
    if (makedirs) {
        std::string parent = fs::path(remote_path).parent_path().string();
        if (!parent.empty()) cmd = "mkdir -p " + shell_quote(parent) + " && " + cmd;
    }

    auto r = run_with_input(cmd, content.data(), content.size(), timeout_secs_);
    sshcp_log_shell("send", cmd, r);
    return r;
}

SSHResult SSHConnection::run_with_input(const std::string& command,
                                        const char* data, size_t data_len,
                                        int timeout_secs) {
    LIBSSH2_SESSION* session = session_mgr_.get_raw_session();
    if (!session) {
        return SSHResult{-1, "", "No session available"};
    }

    // Open a new exec channel (no PTY, binary-clean)
    LIBSSH2_CHANNEL* exec_ch = nullptr;
    auto open_deadline = std::chrono::steady_clock::now() + std::chrono::seconds(SSH_CHANNEL_OPEN_SECS);
    while (std::chrono::steady_clock::now() < open_deadline) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            exec_ch = libssh2_channel_open_session(session);
            if (!exec_ch && libssh2_session_last_errno(session) != LIBSSH2_ERROR_EAGAIN) {
                return SSHResult{-1, "", "Failed to open exec channel"};
            }
        }
        if (exec_ch) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    if (!exec_ch) {
        return SSHResult{-1, "", "Timed out opening exec channel"};
    }

    // Execute the command
    int rc = LIBSSH2_ERROR_EAGAIN;
    auto exec_deadline = std::chrono::steady_clock::now() + std::chrono::seconds(SSH_CHANNEL_OPEN_SECS);
    while (std::chrono::steady_clock::now() < exec_deadline) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            rc = libssh2_channel_exec(exec_ch, command.c_str());
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    if (rc != 0) {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        libssh2_channel_free(exec_ch);
        return SSHResult{-1, "", "Failed to exec command on channel"};
    }

    // Write all data to stdin
    size_t sent = 0;
    int write_retries = 0;
    while (sent < data_len) {
        size_t chunk = std::min(data_len - sent, static_cast<size_t>(SEND_CHUNK_SIZE));
        ssize_t w;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            w = libssh2_channel_write(exec_ch, data + sent, chunk);
        }
        if (w == LIBSSH2_ERROR_EAGAIN) {
            if (++write_retries > 1000) {
                std::lock_guard<std::mutex> lock(*io_mutex_);
                libssh2_channel_close(exec_ch);
                libssh2_channel_free(exec_ch);
                return SSHResult{-1, "", "Write stalled sending data to channel"};
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            continue;
        }
        if (w < 0) {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_channel_close(exec_ch);
            libssh2_channel_free(exec_ch);
            return SSHResult{-1, "", "Channel write error sending data"};
        }
        write_retries = 0;
        sent += static_cast<size_t>(w);
    }

    // Close stdin (send EOF) so the remote command knows input is done
    {
        int eof_rc;
        do {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            eof_rc = libssh2_channel_send_eof(exec_ch);
        } while (eof_rc == LIBSSH2_ERROR_EAGAIN &&
                 (std::this_thread::sleep_for(std::chrono::milliseconds(10)), true));
    }

    // Drain stdout and stderr together until the channel closes
    std::string output;
    std::string stderr_data;
    char buf[SSH_READ_BUF_SIZE];
    int effective_timeout = (timeout_secs > 0) ? timeout_secs : SSH_CMD_TIMEOUT_SECS;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(effective_timeout);
    bool finished = false;
    bool read_error = false;

    while (std::chrono::steady_clock::now() < deadline) {
        ssize_t n, e;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            n = libssh2_channel_read(exec_ch, buf, sizeof(buf));
        }
        if (n > 0) output.append(buf, static_cast<size_t>(n));
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            e = libssh2_channel_read_stderr(exec_ch, buf, sizeof(buf));
        }
        if (e > 0) stderr_data.append(buf, static_cast<size_t>(e));

        if ((n < 0 && n != LIBSSH2_ERROR_EAGAIN) || (e < 0 && e != LIBSSH2_ERROR_EAGAIN)) {
            read_error = true;
            break;
        }
        if (n > 0 || e > 0) continue;

        bool eof;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            eof = libssh2_channel_eof(exec_ch);
        }
        if (eof) {
            finished = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    // Get exit status
    int exit_status = -1;
    do {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        rc = libssh2_channel_close(exec_ch);
    } while (rc == LIBSSH2_ERROR_EAGAIN &&
             (std::this_thread::sleep_for(std::chrono::milliseconds(10)), true));
    if (rc == 0 && finished) {
        do {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            rc = libssh2_channel_wait_closed(exec_ch);
        } while (rc == LIBSSH2_ERROR_EAGAIN &&
                 (std::this_thread::sleep_for(std::chrono::milliseconds(10)), true));
        std::lock_guard<std::mutex> lock(*io_mutex_);
        exit_status = libssh2_channel_get_exit_status(exec_ch);
    }

    {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        libssh2_channel_free(exec_ch);
    }

    if (read_error) {
        return SSHResult{-1, output, "SSH channel read error"};
    }
    if (!finished) {
        return SSHResult{-1, output, "Command timed out after " + std::to_string(effective_timeout) + "s"};
    }
    return SSHResult{exit_status, output, stderr_data};
}
