#include "path_resolver.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/utils.hpp>

DestSpec DestSpec::parse(const std::string& dest) {
    if (dest.empty()) return unset();

    if (!fs::path(dest).is_absolute()) {
        throw CpConfigError("Destination paths must be absolute, got '" + dest + "'");
    }
    DestSpec spec;
    spec.kind = dest.back() == '/' ? Kind::Dir : Kind::Path;
    spec.value = dest;
    return spec;
}

static std::string strip_userinfo_and_port(const std::string& netloc) {
    std::string host = netloc;
    auto at = host.rfind('@');
    if (at != std::string::npos) host = host.substr(at + 1);

    // host:port -> hostport (IPv6 literals keep their colons)
    if (!host.empty() && host.front() != '[') {
        std::string folded;
        for (char c : host) {
            if (c != ':') folded += c;
        }
        host = folded;
    }
    return host;
}

fs::path extrn_path(const std::string& url,
                    const std::string& saltenv,
                    const CacheRootPolicy& roots,
                    const std::optional<std::string>& override) {
    UrlParts parts = split_url(url);
    std::string netloc = strip_userinfo_and_port(parts.netloc);

    std::string file_name = parts.path;
    if (!parts.query.empty()) file_name += "-" + parts.query;
    while (!file_name.empty() && file_name.front() == '/') file_name.erase(0, 1);
    if (file_name.empty() || file_name.back() == '/') file_name += "index.html";

    fs::path root = roots.control_root(override) / EXTRN_SUBDIR / saltenv;
    if (!netloc.empty()) root /= netloc;
    fs::path full = (root / file_name).lexically_normal();

    if (!path_strictly_within(full, root)) {
        throw CpConfigError("Invalid path: URL '" + url + "' escapes the extrn_files cache");
    }
    return full;
}

fs::path resolve_cache_dest(const SourceSpec& spec,
                            const std::string& saltenv,
                            const CacheRootPolicy& roots,
                            const std::optional<std::string>& override) {
    std::string env = effective_saltenv(spec, saltenv);

    if (auto salt = std::get_if<SaltSource>(&spec)) {
        fs::path root = roots.control_root(override) / FILES_SUBDIR / env;
        fs::path full = (root / salt->path).lexically_normal();
        if (salt->path.empty() || !path_strictly_within(full, root)) {
            throw CpConfigError("Invalid path: '" + source_uri(spec) + "' escapes the files cache");
        }
        return full;
    }
    if (auto remote = std::get_if<RemoteSource>(&spec)) {
        return extrn_path(remote->url, env, roots, override);
    }
    throw CpConfigError("Cannot cache local files over SSH: '" +
                        std::get<LocalSource>(spec).path + "'");
}

TargetDest resolve_target_dest(const DestSpec& dest,
                               const std::string& source_basename,
                               const std::string& mirror_path,
                               const fs::path& target_root) {
    TargetDest out;
    switch (dest.kind) {
    case DestSpec::Kind::Unset:
        out.path = mirror_path;
        out.must_probe_dir = true;
        out.replace_dir = true;
        break;
    case DestSpec::Kind::Dir:
        out.path = dest.value + source_basename;
        // The joined path is not probed; a directory already there makes the
        // send fail with SendFailed.
        out.must_probe_dir = false;
        break;
    case DestSpec::Kind::Path:
        out.path = dest.value;
        out.must_probe_dir = true;
        // Inside the cache a directory squatting on an entry is stale; replace it
        out.replace_dir = path_strictly_within(dest.value, target_root);
        break;
    }
    return out;
}
