#include "safe_remove.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

namespace fs = std::filesystem;

SafeRemove::SafeRemove(Shell& shell) : shell_(shell) {}

void SafeRemove::validate(const std::string& path, const fs::path& target_root) {
    fs::path p(path);
    if (path.empty() || !p.is_absolute() || p.lexically_normal() == p.root_path()) {
        throw CpConfigError(fmt::format(
            "Not deleting unspecified, relative or root path: '{}'", path));
    }
    if (!path_within(p, target_root)) {
        throw CpConfigError(fmt::format(
            "Not recursively deleting a path outside of the cachedir. Path: '{}'", path));
    }
}

bool SafeRemove::remove_path(const std::string& path, const fs::path& target_root) {
    validate(path, target_root);

    std::string cmd = "rm -rf " + shell_quote(fs::path(path).lexically_normal().string());
    auto r = shell_.exec_cmd(cmd);
    if (r.failed()) {
        sshcp_log_error(fmt::format("Failed deleting path '{}': {}", path, r.error_output()));
        sshcp_log_shell("rm", cmd, r);
        return false;
    }
    sshcp_log(fmt::format("Removed '{}' on target", path));
    return true;
}
