#include <gtest/gtest.h>
#include <core/config.hpp>
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <cstdlib>
#include <fstream>

TEST(Config, EmptyDocumentGivesDefaults) {
    auto r = Config::parse("");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& c = r.value.client();
    EXPECT_TRUE(c.url.empty());
    EXPECT_FALSE(c.strict_host_key);
    EXPECT_EQ(c.connect_timeout, 30);
    EXPECT_EQ(c.auth_timeout, 10);
    EXPECT_EQ(c.exec_timeout, 0);
    EXPECT_TRUE(c.ssh_properties.empty());
}

TEST(Config, ParsesAllKeys) {
    auto r = Config::parse(R"(
url: https://ci.example.com/
user: builder
identity_files:
  - /keys/id_ed25519
  - /keys/id_rsa
strict_host_key: true
known_hosts: /tmp/kh
auth_timeout: 20
exec_timeout: 600
ssh_properties:
  kex: curve25519-sha256
  keepalive_interval: 15
verbose: yes
)");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& c = r.value.client();
    EXPECT_EQ(c.url, "https://ci.example.com/");
    EXPECT_EQ(c.user, "builder");
    ASSERT_EQ(c.identity_files.size(), 2u);
    EXPECT_EQ(c.identity_files[1], "/keys/id_rsa");
    EXPECT_TRUE(c.strict_host_key);
    EXPECT_EQ(c.known_hosts, "/tmp/kh");
    EXPECT_EQ(c.auth_timeout, 20);
    EXPECT_EQ(c.exec_timeout, 600);
    EXPECT_TRUE(c.verbose);

    // Properties keep file order
    ASSERT_EQ(c.ssh_properties.size(), 2u);
    EXPECT_EQ(c.ssh_properties[0].first, "kex");
    EXPECT_EQ(c.ssh_properties[1].first, "keepalive_interval");
    EXPECT_EQ(c.ssh_properties[1].second, "15");
}

TEST(Config, ExpandsHomeInPaths) {
    auto r = Config::parse("known_hosts: ~/.ssh/known_hosts\nidentity_files: ~/.ssh/id_rsa\n");
    ASSERT_TRUE(r.is_ok()) << r.error;
    auto home = platform::home_dir();
    EXPECT_EQ(r.value.client().known_hosts, (home / ".ssh" / "known_hosts").string());
    ASSERT_EQ(r.value.client().identity_files.size(), 1u);
    EXPECT_EQ(r.value.client().identity_files[0], (home / ".ssh" / "id_rsa").string());
}

TEST(Config, RejectsBadValues) {
    EXPECT_TRUE(Config::parse("auth_timeout: -1").is_err());
    EXPECT_TRUE(Config::parse("auth_timeout: soon").is_err());
    EXPECT_TRUE(Config::parse("auth_timeout: 0").is_err());
    EXPECT_TRUE(Config::parse("connect_timeout: 0").is_err());
    EXPECT_TRUE(Config::parse("ssh_properties: [a, b]").is_err());
    EXPECT_TRUE(Config::parse("- just\n- a list\n").is_err());
}

TEST(Config, ZeroExecTimeoutMeansNoDeadline) {
    auto r = Config::parse("exec_timeout: 0\n");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.client().exec_timeout, 0);
}

TEST(Config, MissingFileIsNotAnError) {
    auto r = Config::load(platform::temp_file("sshrun_no_such_config"));
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.client().auth_timeout, 10);
}

TEST(Config, LoadsFile) {
    auto path = platform::temp_file("sshrun_config");
    {
        std::ofstream out(path);
        out << "url: http://ci.local\nexec_timeout: 5\n";
    }
    auto r = Config::load(path);
    std::filesystem::remove(path);

    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.client().url, "http://ci.local");
    EXPECT_EQ(r.value.client().exec_timeout, 5);
}

TEST(Config, EnvironmentOverridesFile) {
    auto r = Config::parse("url: http://from-file\nuser: file-user\n");
    ASSERT_TRUE(r.is_ok());
    Config config = r.value;

    setenv(ENV_URL, "http://from-env", 1);
    unsetenv(ENV_USER);
    config.apply_environment();
    unsetenv(ENV_URL);

    EXPECT_EQ(config.client().url, "http://from-env");
    EXPECT_EQ(config.client().user, "file-user");
}

TEST(Config, GlobalConfigPath) {
    EXPECT_EQ(get_global_config_path().string(),
              (platform::home_dir() / ".sshrun" / "config.yaml").string());
}
