#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <functional>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Remote shell command result. exit_code -1 means the transport itself failed.
struct SSHResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }

    // stderr if the command wrote any, stdout otherwise
    std::string error_output() const {
        return stderr_data.empty() ? stdout_data : stderr_data;
    }
};

// Configuration structures
struct TargetConfig {
    std::string id;
    std::string host;
    int port = 22;
    std::string user;
    std::optional<std::string> password;
    std::optional<std::string> ssh_key_path;
    int timeout = 30;
};

struct CacheSettings {
    std::string cachedir;                       // control-side cache base
    std::string remote_cachedir;                // target-side cache base
    std::string connection_namespace;           // e.g. "salt-ssh"
};

// saltenv -> ordered list of file root directories
using FileRoots = std::map<std::string, std::vector<std::string>>;

// Template variables passed to a renderer
using TemplateContext = std::map<std::string, std::string>;

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
