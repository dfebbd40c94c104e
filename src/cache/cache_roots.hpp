#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Computes the two cache roots for one connection.
//
//   control root:  <cachedir>/<namespace>/<target>[/<override>]
//                  absolute overrides land under .../absolute_root/<override>
//   target root:   <remote_cachedir>[/<override>], or an absolute override as-is
//
// Immutable after construction; one instance per client.
class CacheRootPolicy {
public:
    CacheRootPolicy(const CacheSettings& settings, const std::string& target_id);

    // Control-side root for an optional cachedir override. Never escapes
    // default_control_root(), regardless of the override or the cwd.
    fs::path control_root(const std::optional<std::string>& override = std::nullopt) const;

    // Target-side root for an optional cachedir override.
    fs::path target_root(const std::optional<std::string>& override = std::nullopt) const;

    // Same as control_root(); named for the cachedir-override resolution step.
    fs::path resolve(const std::optional<std::string>& override) const { return control_root(override); }

    // Re-root a path between the two sides. Paths already on the requested
    // side, or outside both roots, are returned unchanged.
    fs::path convert_path(const fs::path& path,
                          const std::optional<std::string>& override = std::nullopt,
                          bool to_control = false) const;

    const fs::path& default_control_root() const { return control_base_; }
    const fs::path& default_target_root() const { return target_base_; }
    const std::string& target_id() const { return target_id_; }

private:
    fs::path control_base_;   // <cachedir>/<namespace>/<target>
    fs::path target_base_;    // <remote_cachedir>
    std::string target_id_;
};
