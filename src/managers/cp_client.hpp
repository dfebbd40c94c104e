#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <core/types.hpp>
#include <cache/cache_roots.hpp>
#include <cache/path_resolver.hpp>
#include <remote/shell.hpp>
#include "cache_materializer.hpp"
#include "target_map.hpp"
#include "transfer_engine.hpp"

// Caches content-store files on the control side and mirrors them onto one
// target through a restricted shell. One client per connection.
//
// Configuration errors (unsupported source, relative destination, unsafe
// remove) throw CpConfigError. Transport failures come back as a
// TransferResult status or a Result error.
class SSHCpClient {
public:
    using Override = std::optional<std::string>;

    SSHCpClient(Shell& shell,
                CacheMaterializer& store,
                const CacheSettings& settings,
                const std::string& target_id);

    // Cache into files/ or extrn_files/ and mirror to the same layout on the target.
    TransferResult cache_file(const std::string& uri,
                              const std::string& saltenv = "base",
                              const Override& cachedir = std::nullopt);

    std::vector<TransferResult> cache_files(const std::vector<std::string>& uris,
                                            const std::string& saltenv = "base");

    // Every file below a salt:// directory. Patterns are globs, or
    // ECMAScript regexes when prefixed with "E@".
    std::vector<TransferResult> cache_dir(const std::string& uri,
                                          const std::string& saltenv = "base",
                                          const std::string& include_pat = "",
                                          const std::string& exclude_pat = "",
                                          const Override& cachedir = std::nullopt);

    std::vector<TransferResult> cache_master(const std::string& saltenv = "base");

    TransferResult get_file(const std::string& uri,
                            const std::string& dest,
                            const std::string& saltenv = "base",
                            bool makedirs = false,
                            const Override& cachedir = std::nullopt);

    // Files under `uri` land at dest/<last dir component>/<rest>, sorted by
    // target path.
    std::vector<TransferResult> get_dir(const std::string& uri,
                                        const std::string& dest,
                                        const std::string& saltenv = "base");

    TransferResult get_url(const std::string& uri,
                           const std::string& dest,
                           const std::string& saltenv = "base",
                           bool makedirs = false,
                           const Override& cachedir = std::nullopt);

    // Bytes of a URL without caching it. salt:// sources are still cached and
    // mirrored to the target first.
    Result<std::string> get_url_contents(const std::string& uri,
                                         const std::string& saltenv = "base");

    Result<std::string> get_file_str(const std::string& uri,
                                     const std::string& saltenv = "base");

    TransferResult get_template(const std::string& uri,
                                const std::string& dest,
                                const std::string& renderer = "vars",
                                const TemplateContext& context = {},
                                const std::string& saltenv = "base",
                                bool makedirs = false,
                                const Override& cachedir = std::nullopt);

    // Target-side path of the first cache hit, "" if none. A probe that
    // fails at the transport level is an error, never a miss.
    Result<std::string> is_cached(const std::string& path,
                          const std::string& saltenv = "base",
                          const Override& cachedir = std::nullopt);

    std::string convert_path(const std::string& path,
                             const Override& cachedir = std::nullopt,
                             bool to_control = false) const;

    // Control-side cache location for a URI.
    std::string cache_dest(const std::string& uri,
                           const std::string& saltenv = "base",
                           const Override& cachedir = std::nullopt) const;

    std::vector<std::string> list_master(const std::string& saltenv = "base",
                                         const std::string& prefix = "");

    std::vector<std::string> list_master_dirs(const std::string& saltenv = "base",
                                              const std::string& prefix = "");

    std::vector<std::string> list_states(const std::string& saltenv = "base");

    std::vector<std::string> envs();

    const TargetMap& target_map() const { return target_map_; }
    const CacheRootPolicy& roots() const { return roots_; }

private:
    Shell& shell_;
    CacheMaterializer& store_;
    CacheRootPolicy roots_;
    TargetMap target_map_;
    TransferEngine engine_;

    // Materialize a salt:// or remote source into its control-side cache path.
    TransferResult materialize(const SourceSpec& spec, const std::string& saltenv,
                               const Override& cachedir);

    // Salt files below the directory `uri` names, with their effective env.
    std::vector<std::string> dir_files(const SaltSource& dir, const std::string& env);

    bool exists_on_control(const std::string& control_path) const;
    Result<bool> exists_on_target(const std::string& target_path);
};
