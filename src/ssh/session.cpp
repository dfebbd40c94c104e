#include "session.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <cstring>

// Data passed to keyboard-interactive callback via session abstract pointer
struct KbdAuthData {
    std::string password;
    int prompt_round;
};

// libssh2 keyboard-interactive callback: answer every prompt with the password
static void kbd_callback(const char* /*name*/, int /*name_len*/,
                          const char* /*instruction*/, int /*instruction_len*/,
                          int num_prompts,
                          const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                          LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                          void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);

    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
    data->prompt_round++;
}

SessionManager::SessionManager(const TargetConfig& target)
    : target_(target), session_(nullptr), sock_(-1),
      io_mutex_(std::make_shared<std::mutex>()) {
}

SessionManager::~SessionManager() {
    close();
}

SSHResult SessionManager::establish(StatusCallback callback) {
    auto result = establish_connection(callback);
    if (result.failed()) {
        sshcp_log_error(fmt::format("Connect {}:{} failed: {}",
                                    target_.host, target_.port, result.stderr_data));
    }
    return result;
}

std::string SessionManager::last_error() const {
    if (!session_) return "no session";
    char* msg = nullptr;
    libssh2_session_last_error(session_, &msg, nullptr, 0);
    return msg ? msg : "unknown error";
}

void SessionManager::teardown(const char* reason) {
    if (session_) {
        libssh2_session_disconnect(session_, reason);
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ >= 0) {
        platform::close_socket(sock_);
        sock_ = -1;
    }
}

SSHResult SessionManager::establish_connection(StatusCallback callback) {
    if (callback) {
        callback("Connecting to " + target_.host + "...");
    }

    // Initialize libssh2
    int rc = libssh2_init(0);
    if (rc != 0) {
        return SSHResult{-1, "", "Failed to initialize libssh2"};
    }

    auto sock = platform::connect_tcp(target_.host, target_.port, target_.timeout * 1000);
    if (sock.is_err()) {
        return SSHResult{-1, "", sock.error};
    }
    sock_ = sock.value;

    if (callback) callback("TCP connected, starting SSH handshake...");

    // Create SSH session
    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        teardown("Session init failed");
        return SSHResult{-1, "", "Failed to create SSH session"};
    }

    libssh2_session_set_blocking(session_, 0);

    // SSH handshake (key exchange)
    int ret;
    while ((ret = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        platform::sleep_ms(100);
    }

    if (ret != 0) {
        std::string detail = last_error();
        teardown("Handshake failed");
        return SSHResult{-1, "", "SSH handshake failed: " + detail};
    }

    platform::enable_keepalive(sock_, 60);

    // Enable SSH keepalive (send every 30s)
    libssh2_keepalive_config(session_, 1, 30);

    if (callback) callback("SSH handshake complete, authenticating...");

    auto auth_result = ssh_userauth(callback);
    if (auth_result.failed()) {
        teardown("Authentication failed");
        return auth_result;
    }

    target_str_ = target_.user + "@" + target_.host;

    if (callback) {
        callback("Connected to " + target_.host);
    }
    sshcp_log(fmt::format("Connected to {}:{}", target_str_, target_.port));

    return SSHResult{0, "", ""};
}

SSHResult SessionManager::ssh_userauth(StatusCallback callback) {
    int ret;

    // Check what auth methods the server supports
    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(session_, target_.user.c_str(),
                                              static_cast<unsigned int>(target_.user.length()))) == nullptr) {
        if (libssh2_userauth_authenticated(session_)) {
            return SSHResult{0, "", ""};    // "none" auth accepted
        }
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            break;
        }
        platform::sleep_ms(100);
    }

    std::string methods = auth_list ? auth_list : "";
    if (callback && !methods.empty()) {
        callback("Auth methods: " + methods);
    }

    // Key file first
    if (target_.ssh_key_path && (methods.empty() || methods.find("publickey") != std::string::npos)) {
        if (callback) callback("Using key " + *target_.ssh_key_path + "...");

        while ((ret = libssh2_userauth_publickey_fromfile_ex(
                    session_, target_.user.c_str(),
                    static_cast<unsigned int>(target_.user.length()),
                    nullptr, target_.ssh_key_path->c_str(), "")) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(100);
        }

        if (ret == 0) {
            if (callback) callback("Authentication successful");
            return SSHResult{0, "", ""};
        }
        sshcp_log(fmt::format("Public key auth with {} failed ({})", *target_.ssh_key_path, ret));
    }

    if (!target_.password) {
        return SSHResult{-1, "", "Authentication failed (no usable key and no password configured)"};
    }

    // Try password auth
    if (methods.empty() || methods.find("password") != std::string::npos) {
        if (callback) callback("Using password auth...");

        while ((ret = libssh2_userauth_password(session_,
                target_.user.c_str(), target_.password->c_str())) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(100);
        }

        if (ret == 0) {
            if (callback) callback("Authentication successful");
            return SSHResult{0, "", ""};
        }
    }

    // Servers that only offer keyboard-interactive for passwords
    if (methods.find("keyboard-interactive") != std::string::npos) {
        if (callback) callback("Using keyboard-interactive auth...");

        KbdAuthData kbd_data;
        kbd_data.password = *target_.password;
        kbd_data.prompt_round = 0;

        *libssh2_session_abstract(session_) = &kbd_data;

        while ((ret = libssh2_userauth_keyboard_interactive(session_,
                target_.user.c_str(), kbd_callback)) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(100);
        }
        *libssh2_session_abstract(session_) = nullptr;

        if (ret == 0) {
            if (callback) callback("Authentication successful");
            return SSHResult{0, "", ""};
        }
    }

    return SSHResult{-1, "", "Authentication failed (check user, key or password)"};
}

void SessionManager::close() {
    if (session_) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_disconnect(session_, "Normal disconnection");
        }
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_free(session_);
        }
        session_ = nullptr;
    }

    if (sock_ >= 0) {
        platform::close_socket(sock_);
        sock_ = -1;
    }
}
