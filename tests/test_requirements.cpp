#include <gtest/gtest.h>
#include "discovery.hpp"
#include "mock_engine.hpp"
#include "requirements.hpp"

#include <algorithm>
#include <cstdlib>
#include <thread>

using namespace mcpdock;

class RequirementTest : public ::testing::Test {
protected:
    void SetUp() override {
        opts.runtime_binary = FAKE_MCP_SERVER_PATH;
        opts.engine = engine.Endpoint();
        opts.poll_interval = std::chrono::milliseconds(20);
        opts.ready_timeout = std::chrono::seconds(5);
    }

    void TearDown() override {
        ::unsetenv("FAKE_SIDECAR_NEVER_READY");
        ::unsetenv("FAKE_SIDECAR_EXIT");
    }

    MockEngine engine;
    RequirementOptions opts;
};

TEST_F(RequirementTest, UnknownRequirementIsUnsupported) {
    McpError err;
    EXPECT_FALSE(SatisfyRequirement("postgres", opts, nullptr, &err));
    EXPECT_EQ(err.code, ErrorCode::kUnsupportedRequirement);
    EXPECT_TRUE(engine.Pulls().empty());
}

TEST_F(RequirementTest, Neo4jBecomesReady) {
    McpError err;
    auto handle = SatisfyRequirement("neo4j", opts, nullptr, &err);
    ASSERT_TRUE(handle) << FormatError(err);
    EXPECT_EQ(handle->SidecarId().rfind("neo4j-", 0), 0u);
    EXPECT_EQ(handle->SidecarId().size(), 14u);
    ASSERT_EQ(handle->Env().size(), 1u);
    EXPECT_EQ(handle->Env()[0].first, "NEO4J_URL");
    EXPECT_EQ(handle->Env()[0].second, "bolt://localhost:7687");
    std::vector<std::string> network = {"--network", "container:" + handle->SidecarId()};
    EXPECT_EQ(handle->NetworkArgs(), network);
    EXPECT_NE(handle->LogText().find("Started."), std::string::npos);

    ASSERT_EQ(engine.Pulls().size(), 1u);
    EXPECT_EQ(engine.Pulls()[0], "neo4j:latest");

    handle->Release();
    handle->Release();
    EXPECT_TRUE(handle->LogText().empty());
}

TEST_F(RequirementTest, SidecarNamesAreUnique) {
    opts.pull = false;
    McpError err;
    auto a = SatisfyRequirement("neo4j", opts, nullptr, &err);
    auto b = SatisfyRequirement("neo4j", opts, nullptr, &err);
    ASSERT_TRUE(a && b) << FormatError(err);
    EXPECT_NE(a->SidecarId(), b->SidecarId());
}

TEST_F(RequirementTest, NeverReadyTimesOutWithLog) {
    ::setenv("FAKE_SIDECAR_NEVER_READY", "1", 1);
    opts.ready_timeout = std::chrono::milliseconds(500);
    McpError err;
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(SatisfyRequirement("neo4j", opts, nullptr, &err));
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_EQ(err.code, ErrorCode::kRequirementTimeout);
    EXPECT_NE(err.message.find("Starting..."), std::string::npos);
    EXPECT_GE(elapsed, std::chrono::milliseconds(500));
    EXPECT_LT(elapsed, std::chrono::seconds(4));
}

TEST_F(RequirementTest, EarlyExitIsProcessError) {
    ::setenv("FAKE_SIDECAR_EXIT", "1", 1);
    McpError err;
    EXPECT_FALSE(SatisfyRequirement("neo4j", opts, nullptr, &err));
    EXPECT_EQ(err.code, ErrorCode::kProcess);
    EXPECT_NE(err.message.find("sidecar failed to bind"), std::string::npos);
}

TEST_F(RequirementTest, CancelStopsWaiting) {
    ::setenv("FAKE_SIDECAR_NEVER_READY", "1", 1);
    CancelToken cancel;
    std::thread canceller([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        cancel.Cancel();
    });
    McpError err;
    EXPECT_FALSE(SatisfyRequirement("neo4j", opts, &cancel, &err));
    canceller.join();
    EXPECT_EQ(err.code, ErrorCode::kCancelled);
}

class DiscoveryTest : public ::testing::Test {
protected:
    void SetUp() override {
        opts.session.runtime_binary = FAKE_MCP_SERVER_PATH;
        opts.session.engine = engine.Endpoint();
        opts.session.init_timeout = std::chrono::seconds(10);
        opts.requirement.runtime_binary = FAKE_MCP_SERVER_PATH;
        opts.requirement.engine = engine.Endpoint();
        opts.requirement.poll_interval = std::chrono::milliseconds(20);
        opts.requirement.pull = false;
    }

    static ServerSpec server(const std::string& json) {
        McpError err;
        auto spec = ParseServerSpec(nlohmann::json::parse(json), &err);
        EXPECT_TRUE(spec.has_value()) << err.message;
        return spec.value_or(ServerSpec{});
    }

    MockEngine engine;
    DiscoveryOptions opts;
};

TEST_F(DiscoveryTest, ToolsAreNormalized) {
    auto tools = DiscoverTools(server(R"({"image": "mcp/fake"})"), opts, nullptr);
    ASSERT_TRUE(tools.has_value());
    ASSERT_EQ(tools->size(), 3u);
    EXPECT_EQ((*tools)[0].name, "echo");
    EXPECT_EQ((*tools)[1].name, "read_file");
    EXPECT_EQ((*tools)[1].description, "Read a file.");
    EXPECT_EQ((*tools)[1].arguments[0].description, "the file to read");
    EXPECT_EQ((*tools)[2].name, "write_file");
    EXPECT_EQ((*tools)[2].arguments[0].name, "content");
    EXPECT_EQ((*tools)[2].arguments[2].type, "integer");
    ASSERT_TRUE((*tools)[2].annotations.has_value());
    EXPECT_TRUE((*tools)[2].annotations->destructive_hint.value_or(false));
    EXPECT_TRUE(engine.Pulls().empty());
    EXPECT_TRUE(engine.Removes().empty());
}

TEST_F(DiscoveryTest, PullAndCleanupTalkToEngine) {
    opts.pull = true;
    opts.cleanup = true;
    McpError err;
    auto prompts = DiscoverPrompts(server(R"({"image": "mcp/fake:1.0"})"), opts, &err);
    ASSERT_TRUE(prompts.has_value()) << FormatError(err);
    ASSERT_EQ(prompts->size(), 2u);
    EXPECT_EQ((*prompts)[1].arguments[0].name, "document");
    ASSERT_EQ(engine.Pulls().size(), 1u);
    EXPECT_EQ(engine.Pulls()[0], "mcp/fake:1.0");
    ASSERT_EQ(engine.Removes().size(), 1u);
    EXPECT_EQ(engine.Removes()[0], "mcp/fake:1.0?force");
}

TEST_F(DiscoveryTest, HandshakeFailureIsReported) {
    McpError err;
    auto tools = DiscoverTools(
        server(R"({"image": "mcp/fake", "config": {"env": [{"name": "FAKE_FAIL_INIT", "example": "1"}]}})"), opts, &err);
    EXPECT_FALSE(tools.has_value());
    EXPECT_EQ(err.code, ErrorCode::kTransportClosed);
    EXPECT_NE(err.message.find("API_TOKEN"), std::string::npos);
}

TEST_F(DiscoveryTest, RequirementJoinsSidecarNetwork) {
    auto spec = server(R"({"image": "mcp/neo4j", "requirement": "neo4j"})");
    McpError err;
    auto r = CallServerTool(spec, "argv", nlohmann::json::object(), opts, &err);
    ASSERT_TRUE(r.has_value()) << FormatError(err);
    auto argv = (*r)["argv"].get<std::vector<std::string>>();
    auto net = std::find(argv.begin(), argv.end(), "--network");
    ASSERT_NE(net, argv.end());
    ASSERT_NE(net + 1, argv.end());
    EXPECT_EQ((net + 1)->rfind("container:neo4j-", 0), 0u);
    EXPECT_NE(std::find(argv.begin(), argv.end(), "NEO4J_URL"), argv.end());

    r = CallServerTool(spec, "env", {{"name", "NEO4J_URL"}}, opts, &err);
    ASSERT_TRUE(r.has_value()) << FormatError(err);
    EXPECT_EQ((*r)["value"], "bolt://localhost:7687");
}

TEST_F(DiscoveryTest, UnsupportedRequirementStopsBeforeLaunch) {
    McpError err;
    EXPECT_FALSE(DiscoverTools(server(R"({"image": "mcp/x", "requirement": "redis"})"), opts, &err).has_value());
    EXPECT_EQ(err.code, ErrorCode::kUnsupportedRequirement);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
