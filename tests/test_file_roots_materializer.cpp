#include <gtest/gtest.h>
#include <managers/file_roots_materializer.hpp>
#include <core/utils.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class FileRootsTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path primary;
    fs::path overlay;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "sshcp_file_roots_test";
        fs::remove_all(test_dir);
        primary = test_dir / "srv" / "salt";
        overlay = test_dir / "srv" / "overlay";
        fs::create_directories(primary);
        fs::create_directories(overlay);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    void write_file(const fs::path& full, const std::string& content = "") {
        fs::create_directories(full.parent_path());
        std::ofstream(full) << content;
    }

    FileRootsMaterializer store() {
        return FileRootsMaterializer(FileRoots{
            {"base", {primary.string(), overlay.string()}},
            {"dev", {overlay.string()}},
        });
    }
};

TEST_F(FileRootsTest, FileListMergesRootsSorted) {
    write_file(primary / "top.sls");
    write_file(primary / "app" / "a.conf");
    write_file(overlay / "app" / "b.conf");
    write_file(overlay / "app" / "a.conf");

    auto s = store();
    std::vector<std::string> expected = {"app/a.conf", "app/b.conf", "top.sls"};
    EXPECT_EQ(s.file_list("base"), expected);

    expected = {"app/a.conf", "app/b.conf"};
    EXPECT_EQ(s.file_list("base", "app/"), expected);
    EXPECT_TRUE(s.file_list("missing").empty());
}

TEST_F(FileRootsTest, DirListMergesRootsSorted) {
    write_file(primary / "app" / "conf" / "a.conf");
    write_file(overlay / "web" / "b.conf");
    write_file(overlay / "app" / "c.conf");
    write_file(primary / "top.sls");

    auto s = store();
    std::vector<std::string> expected = {"app", "app/conf", "web"};
    EXPECT_EQ(s.dir_list("base"), expected);

    expected = {"app", "app/conf"};
    EXPECT_EQ(s.dir_list("base", "app"), expected);
    expected = {"app", "web"};
    EXPECT_EQ(s.dir_list("dev"), expected);
    EXPECT_TRUE(s.dir_list("missing").empty());
}

TEST_F(FileRootsTest, ListStatesNamesSlsFiles) {
    write_file(primary / "top.sls");
    write_file(primary / "nginx" / "init.sls");
    write_file(primary / "nginx" / "ssl.sls");
    write_file(overlay / "users" / "admins" / "init.sls");
    write_file(overlay / "nginx" / "init.sls");
    write_file(primary / "nginx" / "nginx.conf");
    write_file(primary / ".sls");

    auto s = store();
    std::vector<std::string> expected = {"nginx", "nginx.ssl", "top", "users.admins"};
    EXPECT_EQ(s.list_states("base"), expected);

    expected = {"nginx", "users.admins"};
    EXPECT_EQ(s.list_states("dev"), expected);
    EXPECT_TRUE(s.list_states("missing").empty());
}

TEST_F(FileRootsTest, FirstRootWins) {
    write_file(primary / "app" / "a.conf", "primary");
    write_file(overlay / "app" / "a.conf", "overlay");

    auto s = store();
    fs::path dest = test_dir / "cache" / "a.conf";
    auto r = s.fetch(parse_source("salt://app/a.conf"), "base", dest);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(read_file_bytes(dest), "primary");

    r = s.fetch(parse_source("salt://app/a.conf?saltenv=dev"), "base", dest);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(read_file_bytes(dest), "overlay");
}

TEST_F(FileRootsTest, FetchReplacesDirectoryAtDest) {
    write_file(primary / "x.txt", "x");
    fs::path dest = test_dir / "cache" / "x.txt";
    fs::create_directories(dest / "stale");

    auto r = store().fetch(parse_source("salt://x.txt"), "base", dest);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_TRUE(fs::is_regular_file(dest));
}

TEST_F(FileRootsTest, MissingOrEscapingFileIsAnError) {
    write_file(test_dir / "secret.txt", "no");
    auto s = store();
    EXPECT_TRUE(s.fetch(parse_source("salt://nope.txt"), "base", test_dir / "o").is_err());
    EXPECT_TRUE(s.fetch(parse_source("salt://../../secret.txt"), "base", test_dir / "o").is_err());
    EXPECT_TRUE(s.fetch_contents(parse_source("salt://nope.txt"), "base").is_err());
}

TEST_F(FileRootsTest, FetchContents) {
    write_file(primary / "motd", "welcome");
    auto r = store().fetch_contents(parse_source("salt://motd"), "base");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, "welcome");
}

TEST_F(FileRootsTest, Envs) {
    std::vector<std::string> expected = {"base", "dev"};
    EXPECT_EQ(store().envs(), expected);
}

TEST_F(FileRootsTest, RenderVars) {
    auto r = FileRootsMaterializer::render_vars("host={{ host }} port={{port}}",
                                                {{"host", "web1"}, {"port", "22"}});
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, "host=web1 port=22");

    r = FileRootsMaterializer::render_vars("{{ missing }}", {});
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("missing"), std::string::npos);

    r = FileRootsMaterializer::render_vars("unterminated {{ x", {});
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, "unterminated {{ x");
}

TEST_F(FileRootsTest, RenderRenderers) {
    fs::path src = test_dir / "in.tmpl";
    write_file(src, "Hi {{ who }}");
    auto s = store();

    ASSERT_TRUE(s.render(src, test_dir / "out" / "vars", "vars", {{"who", "ops"}}).is_ok());
    EXPECT_EQ(read_file_bytes(test_dir / "out" / "vars"), "Hi ops");

    ASSERT_TRUE(s.render(src, test_dir / "out" / "plain", "plain", {}).is_ok());
    EXPECT_EQ(read_file_bytes(test_dir / "out" / "plain"), "Hi {{ who }}");

    EXPECT_TRUE(s.render(src, test_dir / "out" / "x", "jinja", {}).is_err());
}
