#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "cache_materializer.hpp"

// Serves salt:// from configured file_roots directories, fetches remote URLs
// with curl, and renders templates.
//
// Renderers:
//   vars   {{ name }} is replaced with context[name]; an unknown name is an error
//   plain  byte copy
class FileRootsMaterializer : public CacheMaterializer {
public:
    explicit FileRootsMaterializer(const FileRoots& roots,
                                   int fetch_timeout_secs = 0);

    Result<void> fetch(const SourceSpec& spec,
                       const std::string& saltenv,
                       const std::filesystem::path& dest) override;

    Result<std::string> fetch_contents(const SourceSpec& spec,
                                       const std::string& saltenv) override;

    std::vector<std::string> file_list(const std::string& saltenv,
                                       const std::string& prefix = "") override;

    std::vector<std::string> dir_list(const std::string& saltenv,
                                      const std::string& prefix = "") override;

    std::vector<std::string> list_states(const std::string& saltenv) override;

    std::vector<std::string> envs() override;

    Result<void> render(const std::filesystem::path& source,
                        const std::filesystem::path& dest,
                        const std::string& renderer,
                        const TemplateContext& context) override;

    // Substitute {{ name }} placeholders. Exposed for tests.
    static Result<std::string> render_vars(const std::string& text,
                                           const TemplateContext& context);

private:
    FileRoots roots_;
    int fetch_timeout_secs_;

    // First file root of `saltenv` that holds `rel`. Empty if none.
    std::filesystem::path find_file(const std::string& saltenv, const std::string& rel) const;

    // Relative paths of regular files (or directories) under every root of
    // `saltenv`, merged and sorted.
    std::vector<std::string> walk(const std::string& saltenv, const std::string& prefix,
                                  bool directories) const;

    Result<void> download(const std::string& url, const std::filesystem::path& dest);
};
