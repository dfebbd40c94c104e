#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include <cache/cache_roots.hpp>
#include <cache/path_resolver.hpp>
#include <remote/shell.hpp>
#include <remote/remote_probe.hpp>
#include <remote/safe_remove.hpp>
#include "target_map.hpp"

enum class TransferStatus {
    Ok,
    MaterializeFailed,    // the content store could not produce the control-side copy
    ProbeFailed,          // a `test` round trip failed at the transport level
    ConflictUnresolved,   // a conflicting remote node could not be removed
    SendFailed,           // the target rejected the write
};

const char* transfer_status_name(TransferStatus status);

struct TransferResult {
    TransferStatus status = TransferStatus::Ok;
    std::string local_path;     // control-side cache entry
    std::string remote_path;    // where it landed (or would have) on the target
    std::string error;

    bool ok() const { return status == TransferStatus::Ok; }

    static TransferResult failure(TransferStatus status, const std::string& local,
                                  const std::string& remote, const std::string& error) {
        return {status, local, remote, error};
    }
};

// Ships one control-side file to the target. Resolves the destination,
// clears conflicting remote nodes, sends once, and records the mapping.
// Single attempt: retry policy belongs to the caller.
class TransferEngine {
public:
    TransferEngine(Shell& shell, const CacheRootPolicy& roots, TargetMap& target_map);

    // `local_path` must already exist on disk inside the control root.
    // On any failure the control-side copy is deleted so a later cache
    // lookup cannot report a stale hit. Files outside the control root are
    // never touched.
    TransferResult send(const std::string& local_path,
                        const DestSpec& dest,
                        bool makedirs,
                        const std::optional<std::string>& override = std::nullopt,
                        const std::string& basename = "");

private:
    Shell& shell_;
    const CacheRootPolicy& roots_;
    TargetMap& target_map_;
    RemoteProbe probe_;
    SafeRemove remover_;

    // Remove any file sitting where a parent directory of `remote_path`
    // has to be. Walks top-down and stops at the first missing ancestor.
    // Runs before the send.
    TransferResult clear_file_ancestors(const std::string& local_path,
                                        const std::string& remote_path,
                                        const std::filesystem::path& target_root);

    void discard_local(const std::string& local_path,
                       const std::optional<std::string>& override);

    TransferResult fail(TransferStatus status, const std::string& local_path,
                        const std::string& remote_path, const std::string& error,
                        const std::optional<std::string>& override);
};
