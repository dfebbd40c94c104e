#include "remote_probe.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

RemoteProbe::RemoteProbe(Shell& shell) : shell_(shell) {}

Result<bool> RemoteProbe::test(const char* flag, const std::string& path) {
    std::string cmd = fmt::format("test {} {}", flag, shell_quote(path));
    auto r = shell_.exec_cmd(cmd);
    if (r.exit_code == 0) return Result<bool>::Ok(true);
    if (r.exit_code == 1) return Result<bool>::Ok(false);

    sshcp_log_shell("probe", cmd, r);
    return Result<bool>::Err(fmt::format("Could not probe '{}' on target (exit {}): {}",
                                         path, r.exit_code, r.error_output()));
}

Result<bool> RemoteProbe::is_dir(const std::string& path) {
    return test("-d", path);
}

Result<bool> RemoteProbe::is_file(const std::string& path) {
    return test("-f", path);
}

Result<bool> RemoteProbe::exists(const std::string& path) {
    return test("-e", path);
}

Result<RemoteNodeKind> RemoteProbe::kind(const std::string& path) {
    auto dir = is_dir(path);
    if (dir.is_err()) return Result<RemoteNodeKind>::Err(dir.error);
    if (dir.value) return Result<RemoteNodeKind>::Ok(RemoteNodeKind::Directory);

    auto file = is_file(path);
    if (file.is_err()) return Result<RemoteNodeKind>::Err(file.error);
    return Result<RemoteNodeKind>::Ok(file.value ? RemoteNodeKind::File : RemoteNodeKind::Missing);
}
