#pragma once

#include <string>
#include <optional>
#include <variant>

// salt://<path>[?saltenv=<env>] served from the configured file roots
struct SaltSource {
    std::string path;                       // no scheme, no leading "/" or "|"
    std::optional<std::string> saltenv;     // from the ?saltenv= query, if any
};

// http(s)://, ftp://, s3://, swift://, fetched by the materializer
struct RemoteSource {
    std::string url;
    std::string scheme;
    std::string netloc;                     // as written, may contain user:pass@ and :port
    std::string path;                       // starts with "/" or is empty
    std::string query;
};

// Bare path or file:// URL already on the control node
struct LocalSource {
    std::string path;
};

using SourceSpec = std::variant<SaltSource, RemoteSource, LocalSource>;

// Pieces of a URL, split the way the cache layout needs them.
struct UrlParts {
    std::string scheme;
    std::string netloc;
    std::string path;
    std::string query;
};

// Split "scheme://netloc/path?query". A string without "://" yields an empty
// scheme and everything in `path`.
UrlParts split_url(const std::string& url);

// Classify a source URI. Throws CpConfigError for unsupported schemes.
SourceSpec parse_source(const std::string& uri);

// Effective saltenv: the source's own ?saltenv= wins, then `requested`,
// then "base".
std::string effective_saltenv(const SourceSpec& spec, const std::string& requested);

// Build "salt://<path>[?saltenv=<env>]".
std::string make_salt_url(const std::string& path, const std::string& saltenv = "");

// Canonical URI of a spec, for logs and extrn path derivation.
std::string source_uri(const SourceSpec& spec);

// Last path component of the source ("foo.txt" for salt://a/foo.txt).
std::string source_basename(const SourceSpec& spec);

inline bool is_salt(const SourceSpec& spec) { return std::holds_alternative<SaltSource>(spec); }
inline bool is_remote(const SourceSpec& spec) { return std::holds_alternative<RemoteSource>(spec); }
inline bool is_local(const SourceSpec& spec) { return std::holds_alternative<LocalSource>(spec); }
