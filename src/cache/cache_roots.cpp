#include "cache_roots.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/utils.hpp>

static bool blank(const std::optional<std::string>& s) {
    return !s.has_value() || s->empty();
}

// lexically_normal() keeps a trailing separator; drop it
static fs::path clean(const fs::path& p) {
    fs::path n = p.lexically_normal();
    if (!n.empty() && n.filename().empty() && n != n.root_path()) n = n.parent_path();
    return n;
}

CacheRootPolicy::CacheRootPolicy(const CacheSettings& settings, const std::string& target_id)
    : target_id_(target_id) {
    if (target_id.empty() || target_id.find('/') != std::string::npos ||
        target_id == "." || target_id == "..") {
        throw CpConfigError("Invalid target identity: '" + target_id + "'");
    }
    fs::path base = expand_user(settings.cachedir);
    if (!base.is_absolute()) {
        throw CpConfigError("cachedir must be absolute, got '" + settings.cachedir + "'");
    }
    std::string ns = settings.connection_namespace.empty()
        ? std::string(DEFAULT_NAMESPACE) : settings.connection_namespace;
    control_base_ = clean(base / ns / target_id);

    std::string remote = settings.remote_cachedir.empty()
        ? std::string(DEFAULT_REMOTE_CACHEDIR) : settings.remote_cachedir;
    target_base_ = clean(remote);
    if (!target_base_.is_absolute()) {
        throw CpConfigError("remote_cachedir must be absolute, got '" + remote + "'");
    }
}

// Drop every root/".." component so an override can only descend.
static fs::path confine(const std::string& override) {
    fs::path out;
    for (const auto& part : fs::path(override).lexically_normal().relative_path()) {
        if (part.empty() || part == "." || part == "..") continue;
        out /= part;
    }
    return out;
}

// `base / rel`, without the trailing separator an empty `rel` would add
static fs::path join(const fs::path& base, const fs::path& rel) {
    return rel.empty() ? base : base / rel;
}

fs::path CacheRootPolicy::control_root(const std::optional<std::string>& override) const {
    if (blank(override)) return control_base_;

    fs::path requested(*override);
    if (requested.is_absolute()) {
        return join(control_base_ / ABSOLUTE_ROOT_SUBDIR, confine(*override));
    }
    return join(control_base_, confine(*override));
}

fs::path CacheRootPolicy::target_root(const std::optional<std::string>& override) const {
    if (blank(override)) return target_base_;

    fs::path requested(*override);
    if (requested.is_absolute()) return clean(requested);
    return join(target_base_, confine(*override));
}

static fs::path rebase(const fs::path& path, const fs::path& from, const fs::path& to) {
    fs::path rel = path.lexically_normal().lexically_relative(from);
    if (rel.empty() || rel == ".") return to;
    return (to / rel).lexically_normal();
}

fs::path CacheRootPolicy::convert_path(const fs::path& path,
                                       const std::optional<std::string>& override,
                                       bool to_control) const {
    fs::path control = control_root(override);
    fs::path target = target_root(override);

    if (to_control) {
        if (path_within(path, control)) return path;
        if (!path_within(path, target)) return path;
        return rebase(path, target, control);
    }
    if (!path_within(path, control)) return path;
    return rebase(path, control, target);
}
