#include <gtest/gtest.h>
#include <managers/cp_client.hpp>
#include <managers/file_roots_materializer.hpp>
#include <core/errors.hpp>
#include <core/utils.hpp>
#include "fake_shell.hpp"
#include <filesystem>
#include <fstream>
#include <memory>

namespace fs = std::filesystem;

static const std::string TROOT = "/var/tmp/sshcp/cache";

// File roots for salt://, canned bodies for remote URLs
class OfflineStore : public FileRootsMaterializer {
public:
    using FileRootsMaterializer::FileRootsMaterializer;

    std::map<std::string, std::string> urls;

    Result<void> fetch(const SourceSpec& spec, const std::string& saltenv,
                       const fs::path& dest) override {
        if (!is_remote(spec)) return FileRootsMaterializer::fetch(spec, saltenv, dest);
        auto it = urls.find(source_uri(spec));
        if (it == urls.end()) return Result<void>::Err("404 Not Found");
        fs::create_directories(dest.parent_path());
        std::ofstream(dest) << it->second;
        return Result<void>::Ok();
    }

    Result<std::string> fetch_contents(const SourceSpec& spec,
                                       const std::string& saltenv) override {
        if (!is_remote(spec)) return FileRootsMaterializer::fetch_contents(spec, saltenv);
        auto it = urls.find(source_uri(spec));
        if (it == urls.end()) return Result<std::string>::Err("404 Not Found");
        return Result<std::string>::Ok(it->second);
    }
};

class CpClientTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path file_root;
    FakeShell shell;
    std::unique_ptr<OfflineStore> store;
    std::unique_ptr<SSHCpClient> client;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "sshcp_client_test";
        fs::remove_all(test_dir);
        file_root = test_dir / "srv";
        fs::create_directories(file_root);

        write_file("foo.txt", "foo");
        write_file("app/a.py", "a");
        write_file("app/b.txt", "b");
        write_file("app/sub/c.py", "c");
        write_file("apps/x.py", "x");
        write_file("tmpl/motd", "Welcome to {{ host }}");

        store = std::make_unique<OfflineStore>(FileRoots{{"base", {file_root.string()}}});
        store->urls["https://example.com/dl/pkg.tgz"] = "tarball";
        store->urls["https://example.com/"] = "<html>";

        client = std::make_unique<SSHCpClient>(
            shell, *store,
            CacheSettings{(test_dir / "cache").string(), TROOT, "salt-ssh"}, "web1");
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    void write_file(const std::string& rel, const std::string& content) {
        auto full = file_root / rel;
        fs::create_directories(full.parent_path());
        std::ofstream(full) << content;
    }

    fs::path control_root() const { return client->roots().control_root(); }

    static std::vector<std::string> remotes(const std::vector<TransferResult>& results) {
        std::vector<std::string> out;
        for (const auto& r : results) out.push_back(r.remote_path);
        return out;
    }
};

// ── cache_file ─────────────────────────────────────────────

TEST_F(CpClientTest, CacheFileMirrorsSaltFile) {
    auto r = client->cache_file("salt://foo.txt");

    ASSERT_TRUE(r.ok()) << r.error;
    EXPECT_EQ(r.local_path, (control_root() / "files/base/foo.txt").string());
    EXPECT_EQ(r.remote_path, TROOT + "/files/base/foo.txt");
    EXPECT_EQ(read_file_bytes(r.local_path), "foo");
    ASSERT_EQ(shell.sent_makedirs.size(), 1u);
    EXPECT_TRUE(shell.sent_makedirs[0]);
    EXPECT_EQ(client->target_map().lookup(r.local_path).value_or(""), r.remote_path);
}

TEST_F(CpClientTest, CacheFileWithOverride) {
    auto r = client->cache_file("salt://foo.txt", "base", std::string("job7"));
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.remote_path, TROOT + "/job7/files/base/foo.txt");
    EXPECT_EQ(r.local_path, (control_root() / "job7/files/base/foo.txt").string());
}

TEST_F(CpClientTest, CacheFileRejectsLocalSources) {
    EXPECT_THROW(client->cache_file("/etc/hosts"), CpConfigError);
    EXPECT_THROW(client->cache_file("file:///etc/hosts"), CpConfigError);
    EXPECT_TRUE(shell.calls.empty());
}

TEST_F(CpClientTest, MissingSourceIsMaterializeFailure) {
    auto r = client->cache_file("salt://nope.txt");
    EXPECT_EQ(r.status, TransferStatus::MaterializeFailed);
    EXPECT_TRUE(shell.calls.empty());
}

TEST_F(CpClientTest, SendFailureLeavesNoCacheEntry) {
    shell.send_result = SSHResult{1, "", "Read-only file system"};
    auto r = client->cache_file("salt://foo.txt");

    EXPECT_EQ(r.status, TransferStatus::SendFailed);
    EXPECT_FALSE(fs::exists(r.local_path));
    EXPECT_EQ(client->is_cached("salt://foo.txt").value, "");
}

TEST_F(CpClientTest, CacheFiles) {
    auto results = client->cache_files({"salt://foo.txt", "salt://app/a.py"});
    std::vector<std::string> expected = {TROOT + "/files/base/foo.txt",
                                         TROOT + "/files/base/app/a.py"};
    EXPECT_EQ(remotes(results), expected);
}

// ── cache_dir / cache_master ───────────────────────────────

TEST_F(CpClientTest, CacheDirStaysInsideDirectory) {
    auto results = client->cache_dir("salt://app");
    std::vector<std::string> expected = {TROOT + "/files/base/app/a.py",
                                         TROOT + "/files/base/app/b.txt",
                                         TROOT + "/files/base/app/sub/c.py"};
    EXPECT_EQ(remotes(results), expected);
}

TEST_F(CpClientTest, CacheDirPatterns) {
    auto results = client->cache_dir("salt://app/", "base", "*.py");
    std::vector<std::string> expected = {TROOT + "/files/base/app/a.py",
                                         TROOT + "/files/base/app/sub/c.py"};
    EXPECT_EQ(remotes(results), expected);

    results = client->cache_dir("salt://app/", "base", "E@\\.txt$");
    expected = {TROOT + "/files/base/app/b.txt"};
    EXPECT_EQ(remotes(results), expected);

    results = client->cache_dir("salt://app/", "base", "*.py", "E@/sub/");
    expected = {TROOT + "/files/base/app/a.py"};
    EXPECT_EQ(remotes(results), expected);
}

TEST_F(CpClientTest, CacheDirRequiresSalt) {
    EXPECT_THROW(client->cache_dir("https://example.com/dl/"), CpConfigError);
}

TEST_F(CpClientTest, CacheMaster) {
    auto results = client->cache_master();
    EXPECT_EQ(results.size(), 6u);
    for (const auto& r : results) EXPECT_TRUE(r.ok()) << r.remote_path;
}

// ── get_file / get_dir ─────────────────────────────────────

TEST_F(CpClientTest, GetFileIntoDirectoryWithoutProbe) {
    auto r = client->get_file("salt://foo.txt", "/tmp/targetdir/");
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.remote_path, "/tmp/targetdir/foo.txt");
    EXPECT_EQ(shell.count_prefix("exec test -d"), 0u);
}

TEST_F(CpClientTest, GetFileIntoExistingDirectory) {
    shell.dirs.insert("/tmp/targetdir");
    auto r = client->get_file("salt://foo.txt", "/tmp/targetdir");
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.remote_path, "/tmp/targetdir/foo.txt");
}

TEST_F(CpClientTest, GetFileUnsetDestMirrors) {
    auto r = client->get_file("salt://foo.txt", "");
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.remote_path, TROOT + "/files/base/foo.txt");
    EXPECT_TRUE(shell.sent_makedirs.at(0));
}

TEST_F(CpClientTest, GetFileConfigErrors) {
    EXPECT_THROW(client->get_file("https://example.com/dl/pkg.tgz", "/tmp/"), CpConfigError);
    EXPECT_THROW(client->get_file("salt://foo.txt", "relative/dest"), CpConfigError);
}

TEST_F(CpClientTest, GetDirKeepsLastComponent) {
    auto results = client->get_dir("salt://app/", "/opt/dest");
    std::vector<std::string> expected = {"/opt/dest/app/a.py",
                                         "/opt/dest/app/b.txt",
                                         "/opt/dest/app/sub/c.py"};
    EXPECT_EQ(remotes(results), expected);
    for (bool makedirs : shell.sent_makedirs) EXPECT_TRUE(makedirs);
}

TEST_F(CpClientTest, GetDirUnsetDestCaches) {
    auto results = client->get_dir("salt://app/sub", "");
    std::vector<std::string> expected = {TROOT + "/files/base/app/sub/c.py"};
    EXPECT_EQ(remotes(results), expected);
}

// ── get_url ────────────────────────────────────────────────

TEST_F(CpClientTest, GetUrlRemoteIntoDirectory) {
    auto r = client->get_url("https://example.com/dl/pkg.tgz", "/opt/");
    ASSERT_TRUE(r.ok()) << r.error;
    EXPECT_EQ(r.remote_path, "/opt/pkg.tgz");
    EXPECT_EQ(r.local_path,
              (control_root() / "extrn_files/base/example.com/dl/pkg.tgz").string());
}

TEST_F(CpClientTest, GetUrlUnsetDestMirrorsExtrn) {
    auto r = client->get_url("https://example.com/dl/pkg.tgz", "");
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.remote_path, TROOT + "/extrn_files/base/example.com/dl/pkg.tgz");
}

TEST_F(CpClientTest, GetUrlIndexHtmlForBareHost) {
    auto r = client->get_url("https://example.com/", "/srv/www/");
    ASSERT_TRUE(r.ok()) << r.error;
    EXPECT_EQ(r.remote_path, "/srv/www/index.html");
}

TEST_F(CpClientTest, GetUrlSaltDelegatesToGetFile) {
    auto r = client->get_url("salt://foo.txt", "/tmp/x/");
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.remote_path, "/tmp/x/foo.txt");
}

TEST_F(CpClientTest, GetUrlFailures) {
    EXPECT_THROW(client->get_url("file:///etc/hosts", "/tmp/"), CpConfigError);
    auto r = client->get_url("https://example.com/missing", "/tmp/");
    EXPECT_EQ(r.status, TransferStatus::MaterializeFailed);
}

TEST_F(CpClientTest, GetUrlContentsRemoteIsNotMirrored) {
    auto r = client->get_url_contents("https://example.com/dl/pkg.tgz");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, "tarball");
    EXPECT_TRUE(shell.calls.empty());
}

TEST_F(CpClientTest, GetUrlContentsSaltIsStillMirrored) {
    auto r = client->get_url_contents("salt://foo.txt");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, "foo");
    EXPECT_EQ(shell.count_prefix("send "), 1u);
}

TEST_F(CpClientTest, GetFileStr) {
    auto r = client->get_file_str("salt://app/b.txt");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, "b");

    EXPECT_TRUE(client->get_file_str("salt://nope").is_err());
}

// ── get_template ───────────────────────────────────────────

TEST_F(CpClientTest, GetTemplateRendersThenSends) {
    auto r = client->get_template("salt://tmpl/motd", "/etc/motd", "vars", {{"host", "web1"}});

    ASSERT_TRUE(r.ok()) << r.error;
    EXPECT_EQ(r.remote_path, "/etc/motd");
    EXPECT_EQ(r.local_path, (control_root() / "extrn_files/base/tmpl/motd").string());
    EXPECT_EQ(read_file_bytes(r.local_path), "Welcome to web1");
}

TEST_F(CpClientTest, TopLevelTemplateKeepsSourceName) {
    write_file("motd", "Hello {{ host }}");

    auto r = client->get_template("salt://motd", "/etc/", "vars", {{"host", "w"}});
    ASSERT_TRUE(r.ok()) << r.error;
    EXPECT_EQ(r.remote_path, "/etc/motd");

    shell.dirs.insert("/srv/conf");
    r = client->get_template("salt://motd", "/srv/conf", "vars", {{"host", "w"}});
    ASSERT_TRUE(r.ok()) << r.error;
    EXPECT_EQ(r.remote_path, "/srv/conf/motd");
}

TEST_F(CpClientTest, GetTemplateErrors) {
    auto r = client->get_template("salt://tmpl/motd", "/etc/motd", "vars", {});
    EXPECT_EQ(r.status, TransferStatus::MaterializeFailed);

    r = client->get_template("salt://tmpl/motd", "/etc/motd", "mako", {{"host", "x"}});
    EXPECT_EQ(r.status, TransferStatus::MaterializeFailed);
    EXPECT_EQ(shell.count_prefix("send "), 0u);
}

// ── is_cached & introspection ──────────────────────────────

TEST_F(CpClientTest, IsCachedChecksBothSides) {
    EXPECT_EQ(client->is_cached("salt://foo.txt").value, "");

    client->cache_file("salt://foo.txt");
    EXPECT_EQ(client->is_cached("salt://foo.txt").value, TROOT + "/files/base/foo.txt");

    // Control copy alone is not enough
    shell.files.erase(TROOT + "/files/base/foo.txt");
    EXPECT_EQ(client->is_cached("salt://foo.txt").value, "");
}

TEST_F(CpClientTest, IsCachedReportsTransportFailure) {
    client->cache_file("salt://foo.txt");
    shell.scripted["test -e"] = SSHResult{-1, "", "connection lost"};

    auto r = client->is_cached("salt://foo.txt");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("connection lost"), std::string::npos);

    // Also when only the target-only lookup reaches the shell
    r = client->is_cached("/etc/app.conf");
    EXPECT_TRUE(r.is_err());
}

TEST_F(CpClientTest, FailedConflictLeavesNoCacheHit) {
    shell.dirs.insert(TROOT + "/files/base/foo.txt");
    shell.scripted["rm -rf"] = SSHResult{1, "", "Device or resource busy"};

    auto r = client->cache_file("salt://foo.txt");
    EXPECT_EQ(r.status, TransferStatus::ConflictUnresolved);
    EXPECT_FALSE(fs::exists(r.local_path));

    auto cached = client->is_cached("salt://foo.txt");
    ASSERT_TRUE(cached.is_ok());
    EXPECT_EQ(cached.value, "");
}

TEST_F(CpClientTest, IsCachedLocalfilesAreTargetOnly) {
    shell.files.insert(TROOT + "/localfiles/etc/app.conf");
    EXPECT_EQ(client->is_cached("/etc/app.conf").value, TROOT + "/localfiles/etc/app.conf");
}

TEST_F(CpClientTest, IsCachedExtrn) {
    client->get_url("https://example.com/dl/pkg.tgz", "");
    EXPECT_EQ(client->is_cached("https://example.com/dl/pkg.tgz").value,
              TROOT + "/extrn_files/base/example.com/dl/pkg.tgz");
}

TEST_F(CpClientTest, Introspection) {
    EXPECT_EQ(client->cache_dest("salt://foo.txt"),
              (control_root() / "files/base/foo.txt").string());
    EXPECT_EQ(client->convert_path((control_root() / "files/x").string()), TROOT + "/files/x");
    EXPECT_EQ(client->convert_path(TROOT + "/files/x", std::nullopt, true),
              (control_root() / "files/x").string());

    std::vector<std::string> expected = {"app/a.py", "app/b.txt", "app/sub/c.py"};
    EXPECT_EQ(client->list_master("base", "app/"), expected);
    EXPECT_EQ(client->envs(), std::vector<std::string>{"base"});

    expected = {"app", "app/sub", "apps"};
    EXPECT_EQ(client->list_master_dirs("base", "app"), expected);
    EXPECT_TRUE(client->list_states().empty());
}
