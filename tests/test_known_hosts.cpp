#include <gtest/gtest.h>
#include <ssh/known_hosts.hpp>
#include <ssh/session.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <fstream>
#include <sstream>

namespace {

std::string slurp(const fs::path& p) {
    std::ifstream in(p);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

HostKey ed25519_key(char fill) {
    HostKey key;
    // "ssh-ed25519" string followed by a 32 byte public key, SSH wire format
    std::string type = "ssh-ed25519";
    key.blob = std::string("\0\0\0\x0b", 4) + type + std::string("\0\0\0\x20", 4) +
               std::string(32, fill);
    key.type = LIBSSH2_HOSTKEY_TYPE_ED25519;
    return key;
}

// A libssh2 session that never connects; enough for the knownhost API
class KnownHostsFixture : public ::testing::Test {
protected:
    Libssh2Library library;
    LIBSSH2_SESSION* session = nullptr;
    fs::path dir;
    fs::path file;
    fs::path log;

    void SetUp() override {
        session = libssh2_session_init();
        ASSERT_NE(session, nullptr);
        dir = platform::temp_file("sshrun_known_hosts");
        file = dir / "ssh" / "known_hosts";
        log = platform::temp_file("sshrun_known_hosts_log");
        set_log_path(log.string());
    }

    void TearDown() override {
        if (session) libssh2_session_free(session);
        std::error_code ec;
        fs::remove_all(dir, ec);
        fs::remove(log, ec);
    }
};

} // namespace

TEST(KnownHosts, HostNameFormat) {
    EXPECT_EQ(known_host_name("build.example.com", 22), "build.example.com");
    EXPECT_EQ(known_host_name("build.example.com", 2222), "[build.example.com]:2222");
}

TEST(KnownHosts, KeyTypeNames) {
    HostKey key;
    key.type = LIBSSH2_HOSTKEY_TYPE_RSA;
    EXPECT_EQ(key.type_name(), "ssh-rsa");
    key.type = LIBSSH2_HOSTKEY_TYPE_ED25519;
    EXPECT_EQ(key.type_name(), "ssh-ed25519");
    key.type = 999;
    EXPECT_EQ(key.type_name(), "unknown");
}

TEST_F(KnownHostsFixture, MissingFileIsEmptyStore) {
    KnownHostsStore store(session, file);
    ASSERT_TRUE(store.load().is_ok());

    auto check = store.check("build.example.com", 2222, ed25519_key('a'));
    ASSERT_TRUE(check.is_ok()) << check.error;
    EXPECT_EQ(check.value, HostKeyCheck::NOT_FOUND);
}

TEST_F(KnownHostsFixture, StrictRejectsUnknownKey) {
    KnownHostsStore store(session, file);
    ASSERT_TRUE(store.load().is_ok());
    HostKeyVerifier verifier(store, unknown_key_policy(true));

    auto r = verifier.verify("build.example.com", 2222, ed25519_key('a'));
    EXPECT_TRUE(r.is_err());
    EXPECT_FALSE(fs::exists(file));
    EXPECT_NE(slurp(log).find("Unknown host key for build.example.com:2222"), std::string::npos);
}

TEST_F(KnownHostsFixture, NonStrictAcceptsAndRemembersKey) {
    {
        KnownHostsStore store(session, file);
        ASSERT_TRUE(store.load().is_ok());
        HostKeyVerifier verifier(store, unknown_key_policy(false));

        auto r = verifier.verify("build.example.com", 2222, ed25519_key('a'));
        ASSERT_TRUE(r.is_ok()) << r.error;
    }

    // Warning on first contact, entry appended in [host]:port form
    std::string logged = slurp(log);
    EXPECT_NE(logged.find("WARN"), std::string::npos);
    EXPECT_NE(logged.find("Unknown host key"), std::string::npos);

    std::string contents = slurp(file);
    EXPECT_EQ(contents.rfind("[build.example.com]:2222 ssh-ed25519 ", 0), 0u) << contents;
    EXPECT_EQ(contents.back(), '\n');

    // A fresh store sees the recorded key
    KnownHostsStore reloaded(session, file);
    ASSERT_TRUE(reloaded.load().is_ok());
    auto same = reloaded.check("build.example.com", 2222, ed25519_key('a'));
    ASSERT_TRUE(same.is_ok());
    EXPECT_EQ(same.value, HostKeyCheck::MATCH);

    auto other = reloaded.check("build.example.com", 2222, ed25519_key('b'));
    ASSERT_TRUE(other.is_ok());
    EXPECT_EQ(other.value, HostKeyCheck::MISMATCH);
}

TEST_F(KnownHostsFixture, MismatchIsRejectedEvenWhenNotStrict) {
    {
        KnownHostsStore store(session, file);
        ASSERT_TRUE(store.add("build.example.com", 22, ed25519_key('a')).is_ok());
    }

    KnownHostsStore store(session, file);
    ASSERT_TRUE(store.load().is_ok());
    bool asked = false;
    HostKeyVerifier verifier(store, [&](const std::string&, const HostKey&) {
        asked = true;
        return true;
    });

    auto r = verifier.verify("build.example.com", 22, ed25519_key('b'));
    EXPECT_TRUE(r.is_err());
    EXPECT_FALSE(asked);
}

TEST_F(KnownHostsFixture, AppendKeepsExistingLines) {
    fs::create_directories(file.parent_path());
    {
        std::ofstream out(file);
        out << "# managed by hand";   // no trailing newline
    }

    KnownHostsStore store(session, file);
    ASSERT_TRUE(store.load().is_ok());
    ASSERT_TRUE(store.add("ci.example.com", 22, ed25519_key('c'), "added-by-test").is_ok());

    std::string contents = slurp(file);
    EXPECT_EQ(contents.rfind("# managed by hand\nci.example.com ssh-ed25519 ", 0), 0u) << contents;
    EXPECT_NE(contents.find("added-by-test"), std::string::npos);
}
