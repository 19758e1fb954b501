#include <gtest/gtest.h>

#include <mcplex/proxy/control_plane.h>

#include "../../support/temp_dir_scope.hpp"

#include <future>
#include <set>
#include <stdexcept>

namespace {

using mcplex::ErrorCode;
using mcplex::Result;
using mcplex::discovery::CapabilityDescriptor;
using mcplex::discovery::CapabilityKind;
using mcplex::discovery::ConfigSource;
using mcplex::discovery::ServerDescriptor;
using mcplex::discovery::ServerStatus;
using mcplex::proxy::ControlPlaneOptions;
using mcplex::proxy::ElicitationPrompt;
using mcplex::proxy::EnablementStore;
using mcplex::proxy::ITransportExecutor;
using mcplex::proxy::json;
using mcplex::proxy::LogEntryKind;
using mcplex::proxy::OperationLog;
using mcplex::proxy::ProxyControlPlane;
using mcplex::test_support::TempDirScope;
using namespace std::chrono_literals;

constexpr const char* kSource = "/home/u/.config/mcp.json";

ServerDescriptor connectedServer(const std::string& name) {
    ServerDescriptor s;
    s.name = name;
    s.originalName = name;
    s.sourcePath = kSource;
    s.connection.command = "run-" + name;
    s.tools.push_back(CapabilityDescriptor::tool(
        "search", "Search things",
        json::parse(R"({"type": "object",
                        "properties": {"q": {"type": "string"}, "limit": {"type": "integer"}},
                        "required": ["q"]})")));
    s.tools.push_back(CapabilityDescriptor::tool("delete_all", "Dangerous"));
    s.tools.push_back(CapabilityDescriptor::tool("ask", "Asks the operator"));
    s.resources.push_back(CapabilityDescriptor::resource("docs/readme", "Readme"));
    s.prompts.push_back(CapabilityDescriptor::prompt("summarize", "Summarize text"));
    s.markConnected();
    return s;
}

// Backend stand-in: echoes requests, fails servers listed in `refuse`, and elicits on "ask".
class FakeExecutor : public ITransportExecutor {
public:
    std::set<std::string> refuse;
    std::set<std::string> connected;
    std::vector<std::string> disconnected;
    std::vector<std::string> invoked;

    Result<void> connect(const ServerDescriptor& server) override {
        if (refuse.count(server.name))
            return mcplex::Error{ErrorCode::NetworkError, "spawn failed"};
        connected.insert(server.name);
        return {};
    }

    void disconnect(const std::string& serverName) override {
        disconnected.push_back(serverName);
        connected.erase(serverName);
    }

    Result<json> invoke(const std::string& serverName, CapabilityKind kind,
                        const std::string& capabilityId, const json& arguments,
                        const ElicitationCallback& elicit) override {
        invoked.push_back(serverName + "/" + capabilityId);
        if (capabilityId == "explode")
            throw std::runtime_error("backend crashed");
        if (capabilityId == "ask") {
            auto outcome = elicit("Confirm?", json::parse(
                                                  R"({"properties": {"ok": {"type": "boolean"}}})"));
            return json{{"action", mcplex::proxy::toString(outcome.action)},
                        {"content", outcome.content}};
        }
        return json{{"server", serverName},
                    {"kind", mcplex::discovery::toString(kind)},
                    {"id", capabilityId},
                    {"args", arguments}};
    }
};

} // namespace

class ProxyControlPlaneTest : public ::testing::Test {
protected:
    void SetUp() override {
        executor_ = std::make_shared<FakeExecutor>();
        // Restrict to github and allow a subset of its capabilities
        store_.enableAllForServer(kSource, "github");
        store_.setCapabilityEnabled(CapabilityKind::Tool, kSource, "github", "search", true);
        store_.setCapabilityEnabled(CapabilityKind::Tool, kSource, "github", "ask", true);
        store_.setCapabilityEnabled(CapabilityKind::Resource, kSource, "github", "docs/readme",
                                    true);
        store_.setCapabilityEnabled(CapabilityKind::Prompt, kSource, "github", "summarize", true);
        plane_ = std::make_unique<ProxyControlPlane>(store_, log_, executor_, options());
    }

    void TearDown() override { plane_.reset(); }

    virtual ControlPlaneOptions options() {
        ControlPlaneOptions opts;
        opts.elicitation.pollInterval = 5ms;
        return opts;
    }

    std::vector<ServerDescriptor> servers() {
        auto failing = connectedServer("broken");
        failing.markError("connection refused");
        return {connectedServer("github"), connectedServer("slack"), failing};
    }

    std::vector<mcplex::proxy::LogEntry> entriesOf(LogEntryKind kind) {
        mcplex::proxy::LogQuery q;
        q.kind = kind;
        return log_.query(q);
    }

    TempDirScope tmp_ = TempDirScope::unique_under("mcplex-plane");
    EnablementStore store_{tmp_.path() / "proxy-config.json"};
    OperationLog log_{100};
    std::shared_ptr<FakeExecutor> executor_;
    std::unique_ptr<ProxyControlPlane> plane_;
};

TEST(ForwardingNamesTest, PrefixesToolsAndResources) {
    EXPECT_EQ(mcplex::proxy::prefixToolName("github", "search"), "github_search");
    EXPECT_EQ(mcplex::proxy::prefixResourceUri("github", "docs/readme"), "github://docs/readme");
}

TEST(ForwardingNamesTest, ParseToolNameSplitsAtFirstUnderscore) {
    auto [server, tool] = ProxyControlPlane::parseToolName("a_b_c");
    EXPECT_EQ(server, "a");
    EXPECT_EQ(tool, "b_c");

    auto plain = ProxyControlPlane::parseToolName("plain");
    EXPECT_EQ(plain.first, "unknown");
    EXPECT_EQ(plain.second, "plain");

    EXPECT_EQ(ProxyControlPlane::parseToolName("trailing_").first, "unknown");
}

TEST(ForwardingNamesTest, ParseResourceServerIgnoresStandardSchemes) {
    EXPECT_EQ(ProxyControlPlane::parseResourceServer("github://docs/readme"), "github");
    EXPECT_EQ(ProxyControlPlane::parseResourceServer("https://example.com/x"), "unknown");
    EXPECT_EQ(ProxyControlPlane::parseResourceServer("file:///tmp/x"), "unknown");
    EXPECT_EQ(ProxyControlPlane::parseResourceServer("no-scheme"), "unknown");
}

TEST(ArgumentValidationTest, ChecksRequiredAndTypes) {
    auto schema = json::parse(R"({"properties": {"q": {"type": "string"},
                                                 "n": {"type": "integer"},
                                                 "free": {}},
                                  "required": ["q"]})");
    EXPECT_TRUE(ProxyControlPlane::validateArguments(schema, json{{"q", "x"}, {"n", 2}}));
    EXPECT_TRUE(ProxyControlPlane::validateArguments(schema, json{{"q", "x"}, {"free", 1.5}}));

    auto missing = ProxyControlPlane::validateArguments(schema, json{{"n", 2}});
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::ValidationError);
    EXPECT_EQ(missing.error().message, "Missing required argument: q");

    auto wrongType = ProxyControlPlane::validateArguments(schema, json{{"q", "x"}, {"n", "two"}});
    ASSERT_FALSE(wrongType);
    EXPECT_EQ(wrongType.error().message, "Argument 'n' must be of type integer");

    EXPECT_FALSE(ProxyControlPlane::validateArguments(schema, json::array()));
    EXPECT_TRUE(ProxyControlPlane::validateArguments(json::object(), nullptr));
}

TEST_F(ProxyControlPlaneTest, ForwardsOnlyEnabledConnectedCapabilities) {
    auto set = plane_->buildForwardingSet(servers());

    ASSERT_EQ(set.servers.size(), 1u);
    EXPECT_EQ(set.servers[0].server.name, "github");
    EXPECT_EQ(set.servers[0].tools.size(), 2u);
    EXPECT_EQ(set.tools.count("github_search"), 1u);
    EXPECT_EQ(set.tools.count("github_ask"), 1u);
    EXPECT_EQ(set.tools.count("github_delete_all"), 0u);
    EXPECT_EQ(set.resources.count("github://docs/readme"), 1u);
    EXPECT_EQ(set.prompts.count("github_summarize"), 1u);
    EXPECT_EQ(set.capabilityCount(), 4u);
    EXPECT_EQ(set.findServer("slack"), nullptr);

    auto j = set.toJson();
    ASSERT_EQ(j.size(), 1u);
    EXPECT_EQ(j[0]["source"], kSource);
}

TEST_F(ProxyControlPlaneTest, UnrestrictedStoreStillRequiresCapabilityChoices) {
    EnablementStore unrestricted(tmp_.path() / "other.json");
    ProxyControlPlane plane(unrestricted, log_, executor_);
    auto set = plane.buildForwardingSet(servers());

    // Every connected server is enabled, none of their capabilities are
    EXPECT_EQ(set.servers.size(), 2u);
    EXPECT_EQ(set.capabilityCount(), 0u);
}

TEST_F(ProxyControlPlaneTest, HierarchicalSourcesAreFlattenedFirst) {
    ConfigSource source;
    source.path = kSource;
    source.servers = servers();
    auto set = plane_->buildForwardingSet(std::vector<ConfigSource>{source});
    ASSERT_EQ(set.servers.size(), 1u);
    EXPECT_EQ(set.servers[0].server.name, "github");
}

TEST_F(ProxyControlPlaneTest, CallsAreRejectedWhileStopped) {
    auto r = plane_->callTool("github_search", json{{"q", "x"}});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidState);
    EXPECT_EQ(log_.size(), 0u);
}

TEST_F(ProxyControlPlaneTest, StartOpensSessionsAndRecordsLifecycle) {
    ASSERT_TRUE(plane_->start(servers()));
    EXPECT_TRUE(plane_->running());
    EXPECT_EQ(plane_->openSessions(), std::vector<std::string>{"github"});
    EXPECT_EQ(executor_->connected.count("github"), 1u);

    auto again = plane_->start(servers());
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().code, ErrorCode::InvalidState);

    auto started = entriesOf(LogEntryKind::ServerStarted);
    ASSERT_EQ(started.size(), 1u);
    EXPECT_EQ(started[0].parameters["port"], 3000);
    // Only github is in the enabled set
    EXPECT_EQ(started[0].parameters["enabled_servers"], 1);

    plane_->stop();
    EXPECT_FALSE(plane_->running());
    EXPECT_TRUE(plane_->openSessions().empty());
    EXPECT_EQ(executor_->disconnected, std::vector<std::string>{"github"});
    EXPECT_EQ(entriesOf(LogEntryKind::ServerStopped).size(), 1u);

    // A second stop is a no-op
    plane_->stop();
    EXPECT_EQ(entriesOf(LogEntryKind::ServerStopped).size(), 1u);
}

TEST_F(ProxyControlPlaneTest, StartWithoutExecutorFails) {
    ProxyControlPlane plane(store_, log_, nullptr);
    auto r = plane.start(servers());
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NotInitialized);
}

TEST_F(ProxyControlPlaneTest, FailedSessionIsReportedAndExcluded) {
    executor_->refuse.insert("github");
    ASSERT_TRUE(plane_->start(servers()));

    EXPECT_TRUE(plane_->forwardingSet().servers.empty());
    EXPECT_EQ(plane_->forwardingSet().capabilityCount(), 0u);
    auto errors = entriesOf(LogEntryKind::ServerError);
    ASSERT_EQ(errors.size(), 1u);
    ASSERT_TRUE(errors[0].error.has_value());
    EXPECT_NE(errors[0].error->find("spawn failed"), std::string::npos);

    auto r = plane_->callTool("github_search", json{{"q", "x"}});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NotFound);
}

TEST_F(ProxyControlPlaneTest, ToolCallIsForwardedAndRecorded) {
    ASSERT_TRUE(plane_->start(servers()));
    auto r = plane_->callTool("github_search", json{{"q", "bugs"}, {"limit", 5}});
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value()["server"], "github");
    EXPECT_EQ(r.value()["id"], "search");
    EXPECT_EQ(r.value()["args"]["limit"], 5);

    auto calls = entriesOf(LogEntryKind::ToolCall);
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].serverName, "github");
    EXPECT_EQ(calls[0].operationName, "search");
    EXPECT_EQ(calls[0].parameters["q"], "bugs");
    EXPECT_STREQ(calls[0].status(), "SUCCESS");
    ASSERT_TRUE(calls[0].durationMs.has_value());
    EXPECT_GE(*calls[0].durationMs, 0.0);
}

TEST_F(ProxyControlPlaneTest, UnknownToolIsRecordedAsError) {
    ASSERT_TRUE(plane_->start(servers()));
    auto r = plane_->callTool("github_delete_all", json::object());
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NotFound);
    EXPECT_TRUE(executor_->invoked.empty());

    auto calls = entriesOf(LogEntryKind::ToolCall);
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].serverName, "github");
    EXPECT_EQ(calls[0].operationName, "delete_all");
    EXPECT_EQ(calls[0].error, std::optional<std::string>("Unknown tool: github_delete_all"));
}

TEST_F(ProxyControlPlaneTest, InvalidArgumentsNeverReachTheBackend) {
    ASSERT_TRUE(plane_->start(servers()));
    auto r = plane_->callTool("github_search", json{{"limit", 5}});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ValidationError);
    EXPECT_TRUE(executor_->invoked.empty());
    EXPECT_STREQ(entriesOf(LogEntryKind::ToolCall).at(0).status(), "ERROR");
}

TEST_F(ProxyControlPlaneTest, BackendExceptionBecomesInternalError) {
    auto s = connectedServer("github");
    s.tools.push_back(CapabilityDescriptor::tool("explode", "Throws"));
    store_.setCapabilityEnabled(CapabilityKind::Tool, kSource, "github", "explode", true);
    ASSERT_TRUE(plane_->start({s}));

    auto r = plane_->callTool("github_explode", json::object());
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InternalError);
    EXPECT_EQ(r.error().message, "backend crashed");
}

TEST_F(ProxyControlPlaneTest, ResourceAndPromptCallsAreRouted) {
    ASSERT_TRUE(plane_->start(servers()));

    auto res = plane_->readResource("github://docs/readme");
    ASSERT_TRUE(res);
    EXPECT_EQ(res.value()["kind"], "resource");
    EXPECT_EQ(res.value()["id"], "docs/readme");

    auto prompt = plane_->getPrompt("github_summarize", nullptr);
    ASSERT_TRUE(prompt);
    EXPECT_EQ(prompt.value()["id"], "summarize");

    auto missing = plane_->readResource("https://example.com/x");
    ASSERT_FALSE(missing);
    auto reads = entriesOf(LogEntryKind::ResourceRead);
    ASSERT_EQ(reads.size(), 2u);
    EXPECT_EQ(reads[0].operationName, "docs/readme");
    EXPECT_EQ(reads[1].serverName, "unknown");
    EXPECT_EQ(entriesOf(LogEntryKind::PromptGet).size(), 1u);
}

TEST_F(ProxyControlPlaneTest, ElicitationRoundsAreAttachedToTheToolCall) {
    ASSERT_TRUE(plane_->start(servers()));
    std::future<void> answer;
    plane_->elicitation().setPendingListener([&](const ElicitationPrompt& prompt) {
        EXPECT_EQ(prompt.message, "Confirm?");
        answer = std::async(std::launch::async,
                            [this] { ASSERT_TRUE(plane_->elicitation().submit("yes")); });
    });

    auto r = plane_->callTool("github_ask", json::object());
    answer.get();
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value()["action"], "accept");
    EXPECT_EQ(r.value()["content"]["ok"], true);

    auto calls = entriesOf(LogEntryKind::ToolCall);
    ASSERT_EQ(calls.size(), 1u);
    ASSERT_EQ(calls[0].elicitations.size(), 1u);
    EXPECT_EQ(calls[0].elicitations[0]["message"], "Confirm?");
    EXPECT_EQ(calls[0].elicitations[0]["action"], "accept");
    EXPECT_EQ(calls[0].elicitations[0]["collected_values"]["ok"], true);
}

TEST_F(ProxyControlPlaneTest, ElicitationHistoryCoversOnlyTheLatestCall) {
    ASSERT_TRUE(plane_->start(servers()));
    std::vector<std::future<void>> answers;
    plane_->elicitation().setPendingListener([&](const ElicitationPrompt&) {
        answers.push_back(std::async(std::launch::async,
                                     [this] { ASSERT_TRUE(plane_->elicitation().submit("yes")); }));
    });

    ASSERT_TRUE(plane_->callTool("github_ask", json::object()));
    ASSERT_TRUE(plane_->callTool("github_ask", json::object()));
    for (auto& a : answers)
        a.get();
    ASSERT_EQ(answers.size(), 2u);

    EXPECT_EQ(plane_->elicitation().history().size(), 1u);
    auto calls = entriesOf(LogEntryKind::ToolCall);
    ASSERT_EQ(calls.size(), 2u);
    for (const auto& call : calls)
        EXPECT_EQ(call.elicitations.size(), 1u);
}

TEST_F(ProxyControlPlaneTest, DuplicateServerNamesGetDistinctSessions) {
    auto first = connectedServer("x");
    first.sourcePath = "/a.json";
    auto second = connectedServer("x");
    second.sourcePath = "/b.json";

    EnablementStore unrestricted(tmp_.path() / "dup.json");
    unrestricted.setCapabilityEnabled(CapabilityKind::Tool, "/a.json", "x", "search", true);
    unrestricted.setCapabilityEnabled(CapabilityKind::Tool, "/b.json", "x", "search", true);
    ProxyControlPlane plane(unrestricted, log_, executor_);

    ASSERT_TRUE(plane.start({first, second}));
    EXPECT_EQ(executor_->connected.size(), 2u);
    EXPECT_EQ(plane.openSessions(), (std::vector<std::string>{"x", "x#2"}));

    auto set = plane.forwardingSet();
    ASSERT_EQ(set.servers.size(), 2u);
    EXPECT_EQ(set.servers[1].server.originalName, "x");
    EXPECT_EQ(set.tools.size(), 2u);
    EXPECT_EQ(set.tools.count("x_search"), 1u);
    ASSERT_EQ(set.tools.count("x#2_search"), 1u);
    EXPECT_EQ(set.tools.at("x#2_search").serverName, "x#2");
    EXPECT_TRUE(entriesOf(LogEntryKind::ServerError).empty());

    plane.stop();
    EXPECT_EQ(executor_->disconnected.size(), 2u);
    EXPECT_TRUE(executor_->connected.empty());
}

TEST_F(ProxyControlPlaneTest, RateLimitRejectsExcessCalls) {
    auto settings = store_.settings();
    settings.rateLimit = 1.0;
    store_.updateSettings(settings);
    ASSERT_TRUE(plane_->start(servers()));

    ASSERT_TRUE(plane_->callTool("github_search", json{{"q", "a"}}));
    auto limited = plane_->callTool("github_search", json{{"q", "b"}});
    ASSERT_FALSE(limited);
    EXPECT_EQ(limited.error().code, ErrorCode::ResourceExhausted);
    EXPECT_EQ(executor_->invoked.size(), 1u);
}

TEST_F(ProxyControlPlaneTest, LoggingOffSuppressesEntries) {
    auto settings = store_.settings();
    settings.loggingOn = false;
    store_.updateSettings(settings);

    ASSERT_TRUE(plane_->start(servers()));
    ASSERT_TRUE(plane_->callTool("github_search", json{{"q", "a"}}));
    plane_->registerClient("c1");
    plane_->stop();
    EXPECT_EQ(log_.size(), 0u);
}

TEST_F(ProxyControlPlaneTest, StartAppliesLogCapacity) {
    auto settings = store_.settings();
    settings.maxLogEntries = 2;
    store_.updateSettings(settings);
    ASSERT_TRUE(plane_->start(servers()));
    for (int i = 0; i < 5; ++i)
        (void)plane_->callTool("github_search", json{{"q", std::to_string(i)}});
    EXPECT_EQ(log_.size(), 2u);
}

TEST_F(ProxyControlPlaneTest, ClientsAreTrackedAndLogged) {
    plane_->registerClient("A", "10.0.0.1");
    plane_->registerClient("B");
    EXPECT_EQ(plane_->connectedClientCount(), 2u);
    plane_->unregisterClient("A");
    EXPECT_EQ(plane_->connectedClientCount(), 1u);
    // Unknown ids are tolerated
    plane_->unregisterClient("ghost");

    EXPECT_EQ(log_.stats().connectedClients, 1u);
    auto connects = entriesOf(LogEntryKind::ClientConnected);
    ASSERT_EQ(connects.size(), 2u);
    EXPECT_EQ(connects[0].parameters["remote_addr"], "10.0.0.1");
}

class PersistingControlPlaneTest : public ProxyControlPlaneTest {
protected:
    ControlPlaneOptions options() override {
        auto opts = ProxyControlPlaneTest::options();
        opts.logDir = tmp_.path() / "logs";
        return opts;
    }
};

TEST_F(PersistingControlPlaneTest, StartWritesSessionLogFile) {
    ASSERT_TRUE(plane_->start(servers()));
    auto path = log_.persistPath();
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->parent_path(), tmp_.path() / "logs");
    EXPECT_EQ(path->extension(), ".jsonl");
    EXPECT_TRUE(std::filesystem::exists(*path));
}
