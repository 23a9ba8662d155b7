#include <gtest/gtest.h>
#include <core/config.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

TEST(Config, FullRemoteSection) {
    auto r = Config::parse(
        "remote:\n"
        "  host: deploy.example.com\n"
        "  user: ops\n"
        "  port: 2222\n"
        "  password: hunter2\n"
        "  timeout: 10\n"
        "  command_timeout: 45\n"
        "  deploy_path: /srv/stack\n");

    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& remote = r.value.remote();
    EXPECT_EQ(remote.host, "deploy.example.com");
    EXPECT_EQ(remote.user, "ops");
    EXPECT_EQ(remote.port, 2222);
    ASSERT_TRUE(remote.password.has_value());
    EXPECT_EQ(*remote.password, "hunter2");
    EXPECT_FALSE(remote.ssh_key_path.has_value());
    EXPECT_EQ(remote.timeout, 10);
    EXPECT_EQ(remote.command_timeout, 45);
    EXPECT_EQ(remote.deploy_path, "/srv/stack");
}

TEST(Config, Defaults) {
    auto r = Config::parse("remote:\n  host: h\n  user: u\n");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.remote().port, 22);
    EXPECT_EQ(r.value.remote().timeout, 30);
    EXPECT_EQ(r.value.remote().command_timeout, 120);
    EXPECT_EQ(r.value.remote().deploy_path, "~");
    EXPECT_FALSE(r.value.remote().password.has_value());
}

TEST(Config, SshKeyPath) {
    auto r = Config::parse("remote:\n  host: h\n  user: u\n  ssh_key: /keys/id_ed25519\n");
    ASSERT_TRUE(r.is_ok()) << r.error;
    ASSERT_TRUE(r.value.remote().ssh_key_path.has_value());
    EXPECT_EQ(*r.value.remote().ssh_key_path, "/keys/id_ed25519");
}

TEST(Config, MissingHostOrUser) {
    EXPECT_TRUE(Config::parse("remote:\n  user: u\n").is_err());
    EXPECT_TRUE(Config::parse("remote:\n  host: h\n").is_err());
    EXPECT_TRUE(Config::parse("other: 1\n").is_err());
}

TEST(Config, BadValues) {
    EXPECT_TRUE(Config::parse("remote:\n  host: h\n  user: u\n  port: 70000\n").is_err());
    EXPECT_TRUE(Config::parse("remote:\n  host: h\n  user: u\n  port: ssh\n").is_err());
    EXPECT_TRUE(Config::parse("remote:\n  host: h\n  user: u\n  timeout: 0\n").is_err());
}

TEST(Config, InvalidYaml) {
    auto r = Config::parse("remote: [unclosed\n");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("Invalid YAML"), std::string::npos);
}

TEST(Config, LoadFromFile) {
    fs::path path = fs::temp_directory_path() / "portscope_config_test.yaml";
    std::ofstream(path) << "remote:\n  host: h\n  user: u\n";

    auto r = Config::load(path);
    fs::remove(path);

    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.remote().host, "h");
}

TEST(Config, LoadMissingFile) {
    auto r = Config::load("/nonexistent/portscope.yaml");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("Cannot read config"), std::string::npos);
}
