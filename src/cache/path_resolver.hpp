#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include <source/source_spec.hpp>
#include "cache_roots.hpp"

namespace fs = std::filesystem;

// Where the caller wants the target-side copy.
//   Unset: mirror the control-side cache layout under the target root
//   Dir:   ends in "/", trusted as a directory, never probed
//   Path:  no trailing "/", the target decides (existing dir vs. file path)
struct DestSpec {
    enum class Kind { Unset, Dir, Path };

    Kind kind = Kind::Unset;
    std::string value;

    static DestSpec unset() { return DestSpec{}; }

    // "" -> Unset, "/x/" -> Dir, "/x" -> Path.
    // Throws CpConfigError for relative destinations.
    static DestSpec parse(const std::string& dest);

    bool is_unset() const { return kind == Kind::Unset; }
};

// Resolved target-side destination, before any remote probing.
struct TargetDest {
    std::string path;
    bool must_probe_dir = false;   // ask the target whether `path` is a directory
    bool replace_dir = false;      // if it is, remove it instead of descending into it
};

// Control-side cache location for a source.
//   Salt:   <control_root>/files/<saltenv>/<path>
//   Remote: <control_root>/extrn_files/<saltenv>/<host>/<url-path>
//   Local:  rejected with CpConfigError
fs::path resolve_cache_dest(const SourceSpec& spec,
                            const std::string& saltenv,
                            const CacheRootPolicy& roots,
                            const std::optional<std::string>& override = std::nullopt);

// extrn_files location for any URL (also used for rendered templates).
// Throws CpConfigError if the URL path would escape its host directory.
fs::path extrn_path(const std::string& url,
                    const std::string& saltenv,
                    const CacheRootPolicy& roots,
                    const std::optional<std::string>& override = std::nullopt);

// Target-side destination for a transfer. `mirror_path` is the target-side
// twin of the control-side cache entry, used when `dest` is Unset.
TargetDest resolve_target_dest(const DestSpec& dest,
                               const std::string& source_basename,
                               const std::string& mirror_path,
                               const fs::path& target_root);
