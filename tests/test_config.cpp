#include <gtest/gtest.h>
#include "config.hpp"
#include "mcp_error.hpp"

#include <cstdlib>

using namespace mcpdock;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clearEnv(); }
    void TearDown() override { clearEnv(); }

    static void clearEnv() {
        for (const char* k : {"MCPDOCK_RUNTIME", "DOCKER_HOST", "MCPDOCK_DEBUG", "MCPDOCK_INIT_TIMEOUT",
                              "MCPDOCK_REQUIREMENT_TIMEOUT", "MCPDOCK_REQUIREMENT_POLL_MS", "MCPDOCK_PROTOCOL_VERSION"}) {
            ::unsetenv(k);
        }
    }
};

TEST_F(ConfigTest, Defaults) {
    auto cfg = LoadConfigFromEnv();
    EXPECT_EQ(cfg.runtime_binary, "docker");
    EXPECT_EQ(cfg.engine.unix_socket, "/var/run/docker.sock");
    EXPECT_FALSE(cfg.debug);
    EXPECT_EQ(cfg.init_timeout_seconds, 60);
    EXPECT_EQ(cfg.requirement_timeout_seconds, 30);
    EXPECT_EQ(cfg.requirement_poll_ms, 100);
    EXPECT_EQ(cfg.protocol_version, "2025-03-26");
}

TEST_F(ConfigTest, EnvironmentOverrides) {
    ::setenv("MCPDOCK_RUNTIME", "podman", 1);
    ::setenv("DOCKER_HOST", "tcp://10.0.0.5:2376", 1);
    ::setenv("MCPDOCK_DEBUG", "yes", 1);
    ::setenv("MCPDOCK_INIT_TIMEOUT", "5", 1);
    ::setenv("MCPDOCK_REQUIREMENT_TIMEOUT", "-3", 1);
    ::setenv("MCPDOCK_REQUIREMENT_POLL_MS", "abc", 1);
    auto cfg = LoadConfigFromEnv();
    EXPECT_EQ(cfg.runtime_binary, "podman");
    EXPECT_TRUE(cfg.engine.unix_socket.empty());
    EXPECT_EQ(cfg.engine.host, "10.0.0.5");
    EXPECT_EQ(cfg.engine.port, 2376);
    EXPECT_TRUE(cfg.debug);
    EXPECT_EQ(cfg.init_timeout_seconds, 5);
    EXPECT_EQ(cfg.requirement_timeout_seconds, 30);
    EXPECT_EQ(cfg.requirement_poll_ms, 100);
}

TEST_F(ConfigTest, ParseEngineEndpoint) {
    auto ep = ParseEngineEndpoint("unix:///run/user/1000/docker.sock");
    EXPECT_EQ(ep.unix_socket, "/run/user/1000/docker.sock");

    ep = ParseEngineEndpoint("http://localhost/v1.43/");
    EXPECT_EQ(ep.host, "localhost");
    EXPECT_EQ(ep.port, 2375);
    EXPECT_EQ(ep.base_path, "/v1.43/");
}

TEST_F(ConfigTest, TryParseBool) {
    bool b = false;
    EXPECT_TRUE(TryParseBool("ON", &b));
    EXPECT_TRUE(b);
    EXPECT_TRUE(TryParseBool("0", &b));
    EXPECT_FALSE(b);
    EXPECT_FALSE(TryParseBool("maybe", &b));
}

TEST(ErrorTest, FormatError) {
    McpError err;
    SetError(&err, ErrorCode::kHandshakeTimeout, "initializing mcp/x: fatal");
    EXPECT_EQ(FormatError(err), std::string(ErrorCodeName(ErrorCode::kHandshakeTimeout)) + ": initializing mcp/x: fatal");
    SetError(nullptr, ErrorCode::kProcess, "ignored");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
