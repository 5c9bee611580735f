// Jackson Coxson

#include <cstdlib>
#include <gtest/gtest.h>
#include <usbmux++/mux_addr.hpp>
#include <usbmux++/option.hpp>

using namespace Usbmux;

namespace {

// Restores USBMUXD_SOCKET_ADDRESS when a test is done with it.
class SocketEnvTest : public ::testing::Test {
  protected:
    void SetUp() override {
        const char* old = std::getenv(kSocketAddressEnv);
        if (old) {
            saved_ = Some(std::string(old));
        }
    }

    void TearDown() override {
        if (saved_.is_some()) {
            setenv(kSocketAddressEnv, saved_.unwrap().c_str(), 1);
        } else {
            unsetenv(kSocketAddressEnv);
        }
    }

    Option<std::string> saved_;
};

} // namespace

TEST(MuxAddr, ParsesUnixPath) {
    auto addr = MuxAddr::parse("UNIX:/tmp/usbmuxd.sock").expect("parse failed");
    EXPECT_EQ(addr.kind(), MuxAddr::Kind::Unix);
    EXPECT_EQ(addr.path(), "/tmp/usbmuxd.sock");
    EXPECT_EQ(addr.to_string(), "UNIX:/tmp/usbmuxd.sock");
}

TEST(MuxAddr, ParsesHostAndPort) {
    auto v4 = MuxAddr::parse("127.0.0.1:27015").expect("parse failed");
    EXPECT_EQ(v4.kind(), MuxAddr::Kind::Tcp);
    EXPECT_EQ(v4.host(), "127.0.0.1");
    EXPECT_EQ(v4.port(), 27015);

    auto v6 = MuxAddr::parse("[::1]:5000").expect("parse failed");
    EXPECT_EQ(v6.host(), "::1");
    EXPECT_EQ(v6.port(), 5000);
    EXPECT_EQ(v6.to_string(), "[::1]:5000");
}

TEST(MuxAddr, RejectsMalformedText) {
    EXPECT_TRUE(MuxAddr::parse("UNIX:").is_err());
    EXPECT_TRUE(MuxAddr::parse("127.0.0.1").is_err());
    EXPECT_TRUE(MuxAddr::parse("127.0.0.1:").is_err());
    EXPECT_TRUE(MuxAddr::parse("127.0.0.1:abc").is_err());
    EXPECT_TRUE(MuxAddr::parse("127.0.0.1:70000").is_err());
    EXPECT_TRUE(MuxAddr::parse("127.0.0.1:0").is_err());
    EXPECT_TRUE(MuxAddr::parse("not-an-ip:27015").is_err());

    auto err = MuxAddr::parse(":27015");
    ASSERT_TRUE(err.is_err());
    EXPECT_EQ(err.unwrap_err().kind, ErrorKind::InvalidArgument);
}

TEST(MuxAddr, UnixPathMustFitSockaddr) {
    EXPECT_TRUE(MuxAddr::unix_new(std::string(200, 'x')).is_err());
    EXPECT_TRUE(MuxAddr::unix_new("").is_err());
}

TEST_F(SocketEnvTest, DefaultIsTheSystemSocket) {
    unsetenv(kSocketAddressEnv);
    auto addr = MuxAddr::default_new();
    EXPECT_EQ(addr.kind(), MuxAddr::Kind::Unix);
    EXPECT_EQ(addr.path(), kDefaultSocketPath);
}

TEST_F(SocketEnvTest, EnvironmentOverridesDefault) {
    setenv(kSocketAddressEnv, "127.0.0.1:5555", 1);
    auto addr = MuxAddr::default_new();
    EXPECT_EQ(addr.kind(), MuxAddr::Kind::Tcp);
    EXPECT_EQ(addr.port(), 5555);

    setenv(kSocketAddressEnv, "UNIX:/run/other.sock", 1);
    EXPECT_EQ(MuxAddr::default_new().path(), "/run/other.sock");
}

TEST_F(SocketEnvTest, BadEnvironmentFallsBack) {
    setenv(kSocketAddressEnv, "garbage", 1);
    auto addr = MuxAddr::default_new();
    EXPECT_EQ(addr.kind(), MuxAddr::Kind::Unix);
    EXPECT_EQ(addr.path(), kDefaultSocketPath);
}

TEST(MuxConfig, Defaults) {
    MuxConfig config;
    EXPECT_EQ(config.client_version, "usbmux++");
    EXPECT_EQ(config.prog_name, "usbmux++");
    EXPECT_EQ(config.default_max_wait, std::chrono::milliseconds(2000));
}
