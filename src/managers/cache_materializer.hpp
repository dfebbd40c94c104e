#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>
#include <source/source_spec.hpp>

// Content store behind the cache. Produces control-side files; never talks
// to the target.
class CacheMaterializer {
public:
    virtual ~CacheMaterializer() = default;

    // Write the content of `spec` to `dest`, creating parent directories.
    virtual Result<void> fetch(const SourceSpec& spec,
                               const std::string& saltenv,
                               const std::filesystem::path& dest) = 0;

    // Content of `spec` without touching the cache.
    virtual Result<std::string> fetch_contents(const SourceSpec& spec,
                                               const std::string& saltenv) = 0;

    // Relative paths of every file in `saltenv` starting with `prefix`, sorted.
    virtual std::vector<std::string> file_list(const std::string& saltenv,
                                               const std::string& prefix = "") = 0;

    // Relative paths of every directory in `saltenv` starting with `prefix`, sorted.
    virtual std::vector<std::string> dir_list(const std::string& saltenv,
                                              const std::string& prefix = "") = 0;

    // State names of the .sls files in `saltenv`: a/b.sls is "a.b", a/init.sls is "a".
    virtual std::vector<std::string> list_states(const std::string& saltenv) = 0;

    virtual std::vector<std::string> envs() = 0;

    // Render `source` into `dest` with the named renderer.
    virtual Result<void> render(const std::filesystem::path& source,
                                const std::filesystem::path& dest,
                                const std::string& renderer,
                                const TemplateContext& context) = 0;
};
