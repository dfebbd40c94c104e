#include "cp_client.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <remote/remote_probe.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <regex>
#include <fnmatch.h>

namespace fs = std::filesystem;

SSHCpClient::SSHCpClient(Shell& shell,
                         CacheMaterializer& store,
                         const CacheSettings& settings,
                         const std::string& target_id)
    : shell_(shell), store_(store),
      roots_(settings, target_id),
      engine_(shell_, roots_, target_map_) {}

// ── Helpers ────────────────────────────────────────────────

static const SaltSource& require_salt(const SourceSpec& spec, const char* op) {
    if (auto salt = std::get_if<SaltSource>(&spec)) return *salt;
    throw CpConfigError(fmt::format("{} only supports salt:// sources, got '{}'",
                                    op, source_uri(spec)));
}

// "E@<regex>" is searched anywhere in `name`; anything else is a shell glob.
static bool pattern_matches(const std::string& pattern, const std::string& name) {
    if (pattern.rfind("E@", 0) == 0) {
        try {
            return std::regex_search(name, std::regex(pattern.substr(2)));
        } catch (const std::regex_error& e) {
            throw CpConfigError(fmt::format("Invalid regex '{}': {}", pattern.substr(2), e.what()));
        }
    }
    return fnmatch(pattern.c_str(), name.c_str(), 0) == 0;
}

static bool include_exclude(const std::string& name,
                            const std::string& include_pat,
                            const std::string& exclude_pat) {
    if (!include_pat.empty() && !pattern_matches(include_pat, name)) return false;
    if (!exclude_pat.empty() && pattern_matches(exclude_pat, name)) return false;
    return true;
}

// Name a remote URL gets when dropped into a directory.
static std::string url_basename(const std::string& url) {
    UrlParts parts = split_url(url);
    bool named = !parts.query.empty() ||
                 (parts.path.size() > 1 && parts.path.back() != '/');
    if (!named) return "index.html";
    return url.substr(url.rfind('/') + 1);
}

TransferResult SSHCpClient::materialize(const SourceSpec& spec, const std::string& saltenv,
                                        const Override& cachedir) {
    std::string local = resolve_cache_dest(spec, saltenv, roots_, cachedir).string();
    std::string env = effective_saltenv(spec, saltenv);

    auto r = store_.fetch(spec, env, local);
    if (r.is_err()) {
        sshcp_log_error(fmt::format("Could not cache {}: {}", source_uri(spec), r.error));
        return TransferResult::failure(TransferStatus::MaterializeFailed, local,
                                       roots_.convert_path(local, cachedir).string(), r.error);
    }
    return TransferResult{TransferStatus::Ok, local, "", ""};
}

std::vector<std::string> SSHCpClient::dir_files(const SaltSource& dir, const std::string& env) {
    std::string prefix = dir.path;
    while (!prefix.empty() && prefix.back() == '/') prefix.pop_back();
    if (!prefix.empty()) prefix += "/";
    return store_.file_list(env, prefix);
}

bool SSHCpClient::exists_on_control(const std::string& control_path) const {
    std::error_code ec;
    return fs::exists(control_path, ec);
}

Result<bool> SSHCpClient::exists_on_target(const std::string& target_path) {
    RemoteProbe probe(shell_);
    auto r = probe.exists(target_path);
    if (r.is_err()) sshcp_log_error(r.error);
    return r;
}

// ── Caching ────────────────────────────────────────────────

TransferResult SSHCpClient::cache_file(const std::string& uri,
                                       const std::string& saltenv,
                                       const Override& cachedir) {
    SourceSpec spec = parse_source(uri);
    auto cached = materialize(spec, saltenv, cachedir);
    if (!cached.ok()) return cached;
    return engine_.send(cached.local_path, DestSpec::unset(), true, cachedir);
}

std::vector<TransferResult> SSHCpClient::cache_files(const std::vector<std::string>& uris,
                                                     const std::string& saltenv) {
    std::vector<TransferResult> results;
    for (const auto& uri : uris) {
        results.push_back(cache_file(uri, saltenv));
    }
    return results;
}

std::vector<TransferResult> SSHCpClient::cache_dir(const std::string& uri,
                                                   const std::string& saltenv,
                                                   const std::string& include_pat,
                                                   const std::string& exclude_pat,
                                                   const Override& cachedir) {
    SourceSpec spec = parse_source(uri);
    const SaltSource& dir = require_salt(spec, "cache_dir");
    std::string env = effective_saltenv(spec, saltenv);

    std::vector<TransferResult> results;
    for (const auto& file : dir_files(dir, env)) {
        if (!include_exclude(file, include_pat, exclude_pat)) continue;
        results.push_back(cache_file(make_salt_url(file), env, cachedir));
    }
    return results;
}

std::vector<TransferResult> SSHCpClient::cache_master(const std::string& saltenv) {
    std::vector<TransferResult> results;
    for (const auto& file : store_.file_list(saltenv)) {
        results.push_back(cache_file(make_salt_url(file), saltenv));
    }
    return results;
}

// ── Transfers to a destination ─────────────────────────────

TransferResult SSHCpClient::get_file(const std::string& uri,
                                     const std::string& dest,
                                     const std::string& saltenv,
                                     bool makedirs,
                                     const Override& cachedir) {
    SourceSpec spec = parse_source(uri);
    require_salt(spec, "get_file");
    DestSpec target = DestSpec::parse(dest);
    if (target.is_unset()) makedirs = true;

    auto cached = materialize(spec, saltenv, cachedir);
    if (!cached.ok()) return cached;
    return engine_.send(cached.local_path, target, makedirs, cachedir, source_basename(spec));
}

std::vector<TransferResult> SSHCpClient::get_dir(const std::string& uri,
                                                 const std::string& dest,
                                                 const std::string& saltenv) {
    SourceSpec spec = parse_source(uri);
    const SaltSource& dir = require_salt(spec, "get_dir");
    std::string env = effective_saltenv(spec, saltenv);
    DestSpec target = DestSpec::parse(dest);

    // salt://a/b/ copied to /x lands in /x/b/...
    std::string base = dir.path;
    while (!base.empty() && base.back() == '/') base.pop_back();
    auto slash = base.rfind('/');
    std::string parent = slash == std::string::npos ? "" : base.substr(0, slash + 1);

    std::vector<TransferResult> results;
    for (const auto& file : dir_files(dir, env)) {
        std::string file_uri = make_salt_url(file);
        if (target.is_unset()) {
            results.push_back(cache_file(file_uri, env));
            continue;
        }
        std::string rel = file.substr(parent.size());
        std::string file_dest = (fs::path(target.value) / rel).string();
        results.push_back(get_file(file_uri, file_dest, env, true));
    }

    std::sort(results.begin(), results.end(),
              [](const TransferResult& a, const TransferResult& b) {
                  return a.remote_path < b.remote_path;
              });
    return results;
}

TransferResult SSHCpClient::get_url(const std::string& uri,
                                    const std::string& dest,
                                    const std::string& saltenv,
                                    bool makedirs,
                                    const Override& cachedir) {
    SourceSpec spec = parse_source(uri);
    if (is_local(spec)) {
        throw CpConfigError(fmt::format(
            "The file:// scheme is not supported over SSH: '{}'", uri));
    }
    if (is_salt(spec)) return get_file(uri, dest, saltenv, makedirs, cachedir);

    DestSpec target = DestSpec::parse(dest);
    if (target.is_unset()) makedirs = true;

    auto cached = materialize(spec, saltenv, cachedir);
    if (!cached.ok()) return cached;
    return engine_.send(cached.local_path, target, makedirs, cachedir, url_basename(uri));
}

Result<std::string> SSHCpClient::get_url_contents(const std::string& uri,
                                                  const std::string& saltenv) {
    SourceSpec spec = parse_source(uri);
    if (is_local(spec)) {
        throw CpConfigError(fmt::format(
            "The file:// scheme is not supported over SSH: '{}'", uri));
    }
    if (is_remote(spec)) return store_.fetch_contents(spec, effective_saltenv(spec, saltenv));

    // salt:// is always mirrored, even for a contents-only request
    return get_file_str(uri, saltenv);
}

Result<std::string> SSHCpClient::get_file_str(const std::string& uri,
                                              const std::string& saltenv) {
    auto r = cache_file(uri, saltenv);
    if (!r.ok()) return Result<std::string>::Err(r.error);
    try {
        return Result<std::string>::Ok(read_file_bytes(r.local_path));
    } catch (const std::exception& e) {
        return Result<std::string>::Err(e.what());
    }
}

TransferResult SSHCpClient::get_template(const std::string& uri,
                                         const std::string& dest,
                                         const std::string& renderer,
                                         const TemplateContext& context,
                                         const std::string& saltenv,
                                         bool makedirs,
                                         const Override& cachedir) {
    SourceSpec spec = parse_source(uri);
    DestSpec target = DestSpec::parse(dest);
    if (target.is_unset()) makedirs = true;

    auto cached = materialize(spec, saltenv, cachedir);
    if (!cached.ok()) return cached;

    std::string env = effective_saltenv(spec, saltenv);
    std::string rendered = extrn_path(uri, env, roots_, cachedir).string();
    auto r = store_.render(cached.local_path, rendered,
                           renderer.empty() ? DEFAULT_RENDERER : renderer, context);
    if (r.is_err()) {
        sshcp_log_error(fmt::format("Rendering {} failed: {}", uri, r.error));
        return TransferResult::failure(TransferStatus::MaterializeFailed, rendered,
                                       roots_.convert_path(rendered, cachedir).string(), r.error);
    }
    std::string name = is_remote(spec) ? url_basename(uri) : source_basename(spec);
    return engine_.send(rendered, target, makedirs, cachedir, name);
}

// ── Introspection ──────────────────────────────────────────

Result<std::string> SSHCpClient::is_cached(const std::string& path,
                                           const std::string& saltenv,
                                           const Override& cachedir) {
    std::string env = saltenv.empty() ? std::string(DEFAULT_SALTENV) : saltenv;
    std::string rel = path;
    std::string extrn_source = path;
    if (path.rfind("salt://", 0) == 0) {
        SourceSpec spec = parse_source(path);
        env = effective_saltenv(spec, env);
        rel = extrn_source = std::get<SaltSource>(spec).path;
    }
    auto start = rel.find_first_not_of("|/");
    rel = start == std::string::npos ? "" : rel.substr(start);

    fs::path target_root = roots_.target_root(cachedir);

    std::string files = (target_root / FILES_SUBDIR / env / rel).string();
    if (exists_on_control(convert_path(files, cachedir, true))) {
        auto on_target = exists_on_target(files);
        if (on_target.is_err()) return Result<std::string>::Err(on_target.error);
        if (on_target.value) return Result<std::string>::Ok(files);
    }

    // Produced on the target itself; the control side never has these
    std::string localfiles = (target_root / LOCALFILES_SUBDIR / rel).string();
    auto local_hit = exists_on_target(localfiles);
    if (local_hit.is_err()) return Result<std::string>::Err(local_hit.error);
    if (local_hit.value) return Result<std::string>::Ok(localfiles);

    std::string extrn = extrn_path(extrn_source, env, roots_, cachedir).string();
    std::string extrn_target = convert_path(extrn, cachedir);
    if (exists_on_control(extrn)) {
        auto on_target = exists_on_target(extrn_target);
        if (on_target.is_err()) return Result<std::string>::Err(on_target.error);
        if (on_target.value) return Result<std::string>::Ok(extrn_target);
    }
    return Result<std::string>::Ok("");
}

std::string SSHCpClient::convert_path(const std::string& path,
                                      const Override& cachedir,
                                      bool to_control) const {
    return roots_.convert_path(path, cachedir, to_control).string();
}

std::string SSHCpClient::cache_dest(const std::string& uri,
                                    const std::string& saltenv,
                                    const Override& cachedir) const {
    return resolve_cache_dest(parse_source(uri), saltenv, roots_, cachedir).string();
}

std::vector<std::string> SSHCpClient::list_master(const std::string& saltenv,
                                                  const std::string& prefix) {
    return store_.file_list(saltenv, prefix);
}

std::vector<std::string> SSHCpClient::list_master_dirs(const std::string& saltenv,
                                                       const std::string& prefix) {
    return store_.dir_list(saltenv, prefix);
}

std::vector<std::string> SSHCpClient::list_states(const std::string& saltenv) {
    return store_.list_states(saltenv);
}

std::vector<std::string> SSHCpClient::envs() {
    return store_.envs();
}
