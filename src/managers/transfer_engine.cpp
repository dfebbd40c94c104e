#include "transfer_engine.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <vector>

const char* transfer_status_name(TransferStatus status) {
    switch (status) {
    case TransferStatus::Ok:                 return "ok";
    case TransferStatus::MaterializeFailed:  return "materialize-failed";
    case TransferStatus::ProbeFailed:        return "probe-failed";
    case TransferStatus::ConflictUnresolved: return "conflict-unresolved";
    case TransferStatus::SendFailed:         return "send-failed";
    }
    return "unknown";
}

TransferEngine::TransferEngine(Shell& shell, const CacheRootPolicy& roots, TargetMap& target_map)
    : shell_(shell), roots_(roots), target_map_(target_map),
      probe_(shell), remover_(shell) {}

TransferResult TransferEngine::fail(TransferStatus status, const std::string& local_path,
                                    const std::string& remote_path, const std::string& error,
                                    const std::optional<std::string>& override) {
    sshcp_log_error(fmt::format("[{}] {} -> {}: {}", transfer_status_name(status),
                                local_path, remote_path, error));
    discard_local(local_path, override);
    return TransferResult::failure(status, local_path, remote_path, error);
}

void TransferEngine::discard_local(const std::string& local_path,
                                   const std::optional<std::string>& override) {
    if (!path_strictly_within(local_path, roots_.control_root(override))) return;

    std::error_code ec;
    fs::remove(local_path, ec);
    if (ec) {
        sshcp_log_error(fmt::format("Could not remove stale cache entry '{}': {}",
                                    local_path, ec.message()));
    }
}

TransferResult TransferEngine::clear_file_ancestors(const std::string& local_path,
                                                    const std::string& remote_path,
                                                    const fs::path& target_root) {
    fs::path remote = fs::path(remote_path).lexically_normal();

    // Proper ancestors, top-down, below the target root (or below "/" when
    // the destination lies outside the cache).
    fs::path start = path_within(remote, target_root) ? target_root : remote.root_path();
    std::vector<fs::path> ancestors;
    for (fs::path p = remote.parent_path(); path_strictly_within(p, start); p = p.parent_path()) {
        ancestors.push_back(p);
    }

    for (auto it = ancestors.rbegin(); it != ancestors.rend(); ++it) {
        std::string ancestor = it->string();
        auto kind = probe_.kind(ancestor);
        if (kind.is_err()) {
            return TransferResult::failure(TransferStatus::ProbeFailed, local_path,
                                           remote_path, kind.error);
        }
        // Nothing below a missing directory can exist yet; mkdir -p creates it
        if (kind.value == RemoteNodeKind::Missing) break;
        if (kind.value == RemoteNodeKind::Directory) continue;

        if (!path_strictly_within(*it, target_root) ||
            !remover_.remove_path(ancestor, target_root)) {
            return TransferResult::failure(
                TransferStatus::ConflictUnresolved, local_path, remote_path,
                fmt::format("path contains files which were not removed: '{}'", ancestor));
        }
    }
    return TransferResult{TransferStatus::Ok, local_path, remote_path, ""};
}

TransferResult TransferEngine::send(const std::string& local_path,
                                    const DestSpec& dest,
                                    bool makedirs,
                                    const std::optional<std::string>& override,
                                    const std::string& basename) {
    fs::path target_root = roots_.target_root(override);
    std::string name = basename.empty() ? fs::path(local_path).filename().string() : basename;
    std::string mirror = roots_.convert_path(local_path, override).string();

    TargetDest td = resolve_target_dest(dest, name, mirror, target_root);
    std::string remote = td.path;

    if (td.must_probe_dir) {
        auto is_dir = probe_.is_dir(remote);
        if (is_dir.is_err()) {
            return fail(TransferStatus::ProbeFailed, local_path, remote, is_dir.error, override);
        }
        if (is_dir.value) {
            if (td.replace_dir) {
                if (!remover_.remove_path(remote, target_root)) {
                    return fail(TransferStatus::ConflictUnresolved, local_path, remote,
                                fmt::format("path contains files which were not removed: '{}'",
                                            remote),
                                override);
                }
            } else {
                remote = (fs::path(remote) / name).string();
            }
        }
    }

    if (makedirs) {
        auto cleared = clear_file_ancestors(local_path, remote, target_root);
        if (!cleared.ok()) {
            return fail(cleared.status, local_path, remote, cleared.error, override);
        }
    }

    auto r = shell_.send(local_path, remote, makedirs);
    if (r.failed()) {
        sshcp_log_shell("send", local_path + " -> " + remote, r);
        return fail(TransferStatus::SendFailed, local_path, remote,
                    fmt::format("Failed to send '{}' to '{}': {}",
                                local_path, remote, r.error_output()),
                    override);
    }

    target_map_.record(local_path, remote);
    sshcp_log(fmt::format("Sent {} -> {}", local_path, remote));
    return TransferResult{TransferStatus::Ok, local_path, remote, ""};
}
