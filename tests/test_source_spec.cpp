#include <gtest/gtest.h>
#include <source/source_spec.hpp>
#include <core/errors.hpp>

TEST(SourceSpecTest, SaltPathIsStripped) {
    auto spec = parse_source("salt://|/srv/foo.txt");
    ASSERT_TRUE(is_salt(spec));
    const auto& salt = std::get<SaltSource>(spec);
    EXPECT_EQ(salt.path, "srv/foo.txt");
    EXPECT_FALSE(salt.saltenv.has_value());
}

TEST(SourceSpecTest, SaltenvFromQuery) {
    auto spec = parse_source("salt://app/conf.ini?saltenv=dev");
    const auto& salt = std::get<SaltSource>(spec);
    EXPECT_EQ(salt.path, "app/conf.ini");
    ASSERT_TRUE(salt.saltenv.has_value());
    EXPECT_EQ(*salt.saltenv, "dev");
}

TEST(SourceSpecTest, EffectiveSaltenvPrecedence) {
    EXPECT_EQ(effective_saltenv(parse_source("salt://a?saltenv=dev"), "prod"), "dev");
    EXPECT_EQ(effective_saltenv(parse_source("salt://a"), "prod"), "prod");
    EXPECT_EQ(effective_saltenv(parse_source("salt://a"), ""), "base");
    EXPECT_EQ(effective_saltenv(parse_source("https://h/a"), "prod"), "prod");
}

TEST(SourceSpecTest, RemoteSchemes) {
    for (const char* uri : {"http://h/a", "https://h/a", "ftp://h/a", "s3://b/k", "swift://c/o"}) {
        EXPECT_TRUE(is_remote(parse_source(uri))) << uri;
    }

    auto spec = parse_source("https://user:pw@example.com:8443/dl/pkg.tgz?v=2");
    const auto& remote = std::get<RemoteSource>(spec);
    EXPECT_EQ(remote.scheme, "https");
    EXPECT_EQ(remote.netloc, "user:pw@example.com:8443");
    EXPECT_EQ(remote.path, "/dl/pkg.tgz");
    EXPECT_EQ(remote.query, "v=2");
}

TEST(SourceSpecTest, LocalForms) {
    EXPECT_TRUE(is_local(parse_source("/etc/hosts")));
    EXPECT_TRUE(is_local(parse_source("relative/file")));
    EXPECT_EQ(std::get<LocalSource>(parse_source("file:///etc/hosts")).path, "/etc/hosts");
    EXPECT_TRUE(is_local(parse_source("c://windows/file")));
}

TEST(SourceSpecTest, UnsupportedSchemeThrows) {
    EXPECT_THROW(parse_source("gopher://h/x"), CpConfigError);
}

TEST(SourceSpecTest, SplitUrlWithoutPath) {
    auto parts = split_url("https://example.com");
    EXPECT_EQ(parts.netloc, "example.com");
    EXPECT_EQ(parts.path, "");

    parts = split_url("plain/path?x=1");
    EXPECT_EQ(parts.scheme, "");
    EXPECT_EQ(parts.path, "plain/path");
    EXPECT_EQ(parts.query, "x=1");
}

TEST(SourceSpecTest, UriAndBasename) {
    EXPECT_EQ(make_salt_url("/a/b.txt"), "salt://a/b.txt");
    EXPECT_EQ(make_salt_url("a/b.txt", "dev"), "salt://a/b.txt?saltenv=dev");
    EXPECT_EQ(source_uri(parse_source("salt://x/y?saltenv=qa")), "salt://x/y?saltenv=qa");
    EXPECT_EQ(source_basename(parse_source("salt://x/y/z.conf")), "z.conf");
    EXPECT_EQ(source_basename(parse_source("https://h/dir/")), "dir");
}
