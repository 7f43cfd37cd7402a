#include <gtest/gtest.h>
#include <ssh/client_properties.hpp>
#include <ssh/session.hpp>
#include <core/errors.hpp>
#include <libssh2.h>

namespace {

class ClientPropertiesFixture : public ::testing::Test {
protected:
    Libssh2Library library;
    LIBSSH2_SESSION* session = nullptr;

    void SetUp() override {
        session = libssh2_session_init();
        ASSERT_NE(session, nullptr);
    }

    void TearDown() override {
        if (session) libssh2_session_free(session);
    }
};

} // namespace

TEST(ClientProperties, KnownNames) {
    EXPECT_TRUE(is_client_property("kex"));
    EXPECT_TRUE(is_client_property("crypt_cs"));
    EXPECT_TRUE(is_client_property("keepalive_interval"));
    EXPECT_FALSE(is_client_property("StrictHostKeyChecking"));
    EXPECT_EQ(client_property_names().front(), "kex");
}

TEST(ClientProperties, NullSessionIsError) {
    EXPECT_TRUE(apply_client_property(nullptr, "kex", "diffie-hellman-group14-sha256").is_err());
}

TEST_F(ClientPropertiesFixture, UnknownNameIsError) {
    auto r = apply_client_property(session, "no_such_property", "1");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("no_such_property"), std::string::npos);
}

TEST_F(ClientPropertiesFixture, MethodPreference) {
    EXPECT_TRUE(apply_client_property(session, "kex", "diffie-hellman-group14-sha256").is_ok());
    EXPECT_TRUE(apply_client_property(session, "comp_cs", "none").is_ok());
    EXPECT_TRUE(apply_client_property(session, "crypt_cs", "not-a-cipher").is_err());
}

TEST_F(ClientPropertiesFixture, BooleanFlags) {
    EXPECT_TRUE(apply_client_property(session, "compression", "yes").is_ok());
    EXPECT_TRUE(apply_client_property(session, "sigpipe", "false").is_ok());
    EXPECT_TRUE(apply_client_property(session, "compression", "maybe").is_err());
}

TEST_F(ClientPropertiesFixture, Banner) {
    EXPECT_TRUE(apply_client_property(session, "banner", "SSH-2.0-sshrun").is_ok());
    EXPECT_TRUE(apply_client_property(session, "banner", "").is_err());
}

TEST_F(ClientPropertiesFixture, KeepaliveInterval) {
    EXPECT_TRUE(apply_client_property(session, "keepalive_interval", "30").is_ok());
    EXPECT_TRUE(apply_client_property(session, "keepalive_interval", "0").is_ok());
    EXPECT_TRUE(apply_client_property(session, "keepalive_interval", "-5").is_err());
    EXPECT_TRUE(apply_client_property(session, "keepalive_interval", "soon").is_err());
}

TEST(ClientProperties, SessionRejectsUnknownPropertyBeforeConnecting) {
    SessionTarget target;
    target.host = "127.0.0.1";
    target.user = "nobody";
    SSHSession session(target);

    PropertyList props = {{"kex", "diffie-hellman-group14-sha256"}, {"bogus", "1"}};
    EXPECT_THROW(session.apply_properties(props), SSHIOError);
}
