#include "file_roots_materializer.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>
#include <set>

namespace fs = std::filesystem;

FileRootsMaterializer::FileRootsMaterializer(const FileRoots& roots, int fetch_timeout_secs)
    : roots_(roots),
      fetch_timeout_secs_(fetch_timeout_secs > 0 ? fetch_timeout_secs : URL_FETCH_TIMEOUT_SECS) {}

fs::path FileRootsMaterializer::find_file(const std::string& saltenv,
                                          const std::string& rel) const {
    auto it = roots_.find(saltenv);
    if (it == roots_.end()) return {};

    for (const auto& dir : it->second) {
        fs::path root = fs::path(expand_user(dir)).lexically_normal();
        fs::path candidate = (root / rel).lexically_normal();
        if (!path_strictly_within(candidate, root)) continue;

        std::error_code ec;
        if (fs::is_regular_file(candidate, ec)) return candidate;
    }
    return {};
}

// Clear whatever sits at `dest` and make sure its parent exists.
static Result<void> prepare_dest(const fs::path& dest) {
    std::error_code ec;
    if (fs::is_directory(dest, ec)) fs::remove_all(dest, ec);
    fs::create_directories(dest.parent_path(), ec);
    if (ec) {
        return Result<void>::Err(fmt::format("Cannot create cache directory '{}': {}",
                                             dest.parent_path().string(), ec.message()));
    }
    return Result<void>::Ok();
}

static Result<void> write_file(const fs::path& dest, const std::string& data) {
    auto prep = prepare_dest(dest);
    if (prep.is_err()) return prep;

    std::ofstream out(dest, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Result<void>::Err("Cannot write cache file: " + dest.string());
    }
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!out) {
        return Result<void>::Err("Short write to cache file: " + dest.string());
    }
    return Result<void>::Ok();
}

Result<void> FileRootsMaterializer::download(const std::string& url, const fs::path& dest) {
    auto prep = prepare_dest(dest);
    if (prep.is_err()) return prep;

    // Download beside the destination, then rename into place so a failed
    // fetch never leaves a partial cache entry.
    fs::path part = dest;
    part += ".part";
    std::string err_log;
    try {
        err_log = platform::temp_file("sshcp-curl").string();
    } catch (const std::exception& e) {
        return Result<void>::Err(e.what());
    }

    int rc = platform::run_process("curl", {
        "-fsSL", "--max-time", std::to_string(fetch_timeout_secs_),
        "-o", part.string(), url,
    }, fetch_timeout_secs_ * 1000 + 5000, err_log);

    std::string err;
    std::error_code ec;
    if (fs::exists(err_log, ec)) {
        try {
            err = read_file_bytes(err_log);
        } catch (const std::exception& e) {
            err = e.what();
        }
        trim(err);
        fs::remove(err_log, ec);
    }

    if (rc != 0) {
        fs::remove(part, ec);
        std::string reason = rc == -1 ? "timed out"
                           : rc == 127 ? "curl could not be started"
                           : fmt::format("curl exit {}", rc);
        sshcp_log_error(fmt::format("Fetch {} failed: {} {}", url, reason, err));
        return Result<void>::Err(fmt::format("Unable to fetch '{}': {}{}", url, reason,
                                             err.empty() ? "" : ": " + err));
    }

    fs::rename(part, dest, ec);
    if (ec) {
        fs::remove(part, ec);
        return Result<void>::Err(fmt::format("Cannot move download into '{}'", dest.string()));
    }
    sshcp_log(fmt::format("Fetched {} -> {}", url, dest.string()));
    return Result<void>::Ok();
}

Result<void> FileRootsMaterializer::fetch(const SourceSpec& spec,
                                          const std::string& saltenv,
                                          const fs::path& dest) {
    std::string env = effective_saltenv(spec, saltenv);

    if (auto salt = std::get_if<SaltSource>(&spec)) {
        fs::path found = find_file(env, salt->path);
        if (found.empty()) {
            return Result<void>::Err(fmt::format(
                "File '{}' not found in saltenv '{}'", source_uri(spec), env));
        }
        auto prep = prepare_dest(dest);
        if (prep.is_err()) return prep;

        std::error_code ec;
        fs::copy_file(found, dest, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            return Result<void>::Err(fmt::format("Cannot copy '{}' into the cache: {}",
                                                 found.string(), ec.message()));
        }
        return Result<void>::Ok();
    }
    if (auto remote = std::get_if<RemoteSource>(&spec)) {
        return download(remote->url, dest);
    }
    return Result<void>::Err("Local sources are not served by the file roots");
}

Result<std::string> FileRootsMaterializer::fetch_contents(const SourceSpec& spec,
                                                          const std::string& saltenv) {
    if (auto salt = std::get_if<SaltSource>(&spec)) {
        std::string env = effective_saltenv(spec, saltenv);
        fs::path found = find_file(env, salt->path);
        if (found.empty()) {
            return Result<std::string>::Err(fmt::format(
                "File '{}' not found in saltenv '{}'", source_uri(spec), env));
        }
        try {
            return Result<std::string>::Ok(read_file_bytes(found));
        } catch (const std::exception& e) {
            return Result<std::string>::Err(e.what());
        }
    }
    if (auto remote = std::get_if<RemoteSource>(&spec)) {
        fs::path tmp;
        try {
            tmp = platform::temp_file("sshcp-fetch");
        } catch (const std::exception& e) {
            return Result<std::string>::Err(e.what());
        }
        auto r = download(remote->url, tmp);
        if (r.is_err()) {
            std::error_code ec;
            fs::remove(tmp, ec);
            return Result<std::string>::Err(r.error);
        }

        std::string data;
        try {
            data = read_file_bytes(tmp);
        } catch (const std::exception& e) {
            std::error_code ec;
            fs::remove(tmp, ec);
            return Result<std::string>::Err(e.what());
        }
        std::error_code ec;
        fs::remove(tmp, ec);
        return Result<std::string>::Ok(data);
    }
    return Result<std::string>::Err("Local sources are not served by the file roots");
}

std::vector<std::string> FileRootsMaterializer::walk(const std::string& saltenv,
                                                     const std::string& prefix,
                                                     bool directories) const {
    std::set<std::string> found;
    auto it = roots_.find(saltenv);
    if (it == roots_.end()) return {};

    for (const auto& dir : it->second) {
        fs::path root = expand_user(dir);
        std::error_code ec;
        if (!fs::is_directory(root, ec)) continue;

        fs::recursive_directory_iterator entries(
            root, fs::directory_options::skip_permission_denied, ec);
        for (; !ec && entries != fs::recursive_directory_iterator(); entries.increment(ec)) {
            bool match = directories ? entries->is_directory(ec) : entries->is_regular_file(ec);
            if (!match) continue;
            std::string rel = entries->path().lexically_relative(root).generic_string();
            if (rel.rfind(prefix, 0) == 0) found.insert(rel);
        }
        if (ec) {
            sshcp_log_error(fmt::format("Listing {} stopped early: {}", root.string(), ec.message()));
        }
    }
    return {found.begin(), found.end()};
}

std::vector<std::string> FileRootsMaterializer::file_list(const std::string& saltenv,
                                                          const std::string& prefix) {
    return walk(saltenv, prefix, false);
}

std::vector<std::string> FileRootsMaterializer::dir_list(const std::string& saltenv,
                                                         const std::string& prefix) {
    return walk(saltenv, prefix, true);
}

// a/b.sls -> a.b, a/init.sls -> a
std::vector<std::string> FileRootsMaterializer::list_states(const std::string& saltenv) {
    static const std::string SLS = ".sls";
    static const std::string INIT = "/init.sls";

    std::set<std::string> states;
    for (const auto& file : walk(saltenv, "", false)) {
        if (file.size() <= SLS.size() ||
            file.compare(file.size() - SLS.size(), SLS.size(), SLS) != 0) {
            continue;
        }
        bool init = file.size() > INIT.size() &&
                    file.compare(file.size() - INIT.size(), INIT.size(), INIT) == 0;
        std::string name = file.substr(0, file.size() - (init ? INIT.size() : SLS.size()));
        std::replace(name.begin(), name.end(), '/', '.');
        states.insert(name);
    }
    return {states.begin(), states.end()};
}

std::vector<std::string> FileRootsMaterializer::envs() {
    std::vector<std::string> out;
    for (const auto& [env, _] : roots_) out.push_back(env);
    return out;
}

Result<std::string> FileRootsMaterializer::render_vars(const std::string& text,
                                                       const TemplateContext& context) {
    std::string out;
    size_t pos = 0;
    while (true) {
        size_t open = text.find("{{", pos);
        if (open == std::string::npos) break;
        size_t close = text.find("}}", open + 2);
        if (close == std::string::npos) break;

        std::string name = text.substr(open + 2, close - open - 2);
        trim(name);
        auto it = context.find(name);
        if (it == context.end()) {
            return Result<std::string>::Err(fmt::format("Undefined template variable '{}'", name));
        }
        out.append(text, pos, open - pos);
        out += it->second;
        pos = close + 2;
    }
    out.append(text, pos, std::string::npos);
    return Result<std::string>::Ok(out);
}

Result<void> FileRootsMaterializer::render(const fs::path& source,
                                           const fs::path& dest,
                                           const std::string& renderer,
                                           const TemplateContext& context) {
    std::string text;
    try {
        text = read_file_bytes(source);
    } catch (const std::exception& e) {
        return Result<void>::Err(e.what());
    }

    if (renderer == "plain") return write_file(dest, text);
    if (renderer == "vars") {
        auto rendered = render_vars(text, context);
        if (rendered.is_err()) return Result<void>::Err(rendered.error);
        return write_file(dest, rendered.value);
    }
    return Result<void>::Err(fmt::format("Unknown renderer '{}'", renderer));
}
