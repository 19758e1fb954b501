#include <gtest/gtest.h>

#include <mcplex/discovery/discovery_engine.h>

#include "../../support/temp_dir_scope.hpp"

#include <atomic>
#include <set>
#include <stdexcept>

namespace {

using mcplex::discovery::CapabilityDescriptor;
using mcplex::discovery::ConfigSource;
using mcplex::discovery::DiscoveryEngine;
using mcplex::discovery::findByKey;
using mcplex::discovery::ICapabilityProber;
using mcplex::discovery::ISupplementalSource;
using mcplex::discovery::ServerDescriptor;
using mcplex::discovery::ServerKind;
using mcplex::discovery::ServerStatus;
using mcplex::discovery::SourceLoader;
using mcplex::test_support::TempDirScope;

// Connects every server except those listed; "throw:" prefixed names raise.
class FakeProber : public ICapabilityProber {
public:
    explicit FakeProber(std::set<std::string> failing = {}) : failing_(std::move(failing)) {}

    ServerDescriptor probe(const ServerDescriptor& server) override {
        calls_.fetch_add(1);
        if (server.name.rfind("throw", 0) == 0)
            throw std::runtime_error("boom");

        ServerDescriptor out = server;
        if (failing_.count(server.name)) {
            out.markError("Connection refused");
            return out;
        }
        out.name = "renamed-by-prober";
        out.tools.push_back(CapabilityDescriptor::tool("echo", "Echo input"));
        out.markConnected();
        return out;
    }

    int calls() const { return calls_.load(); }

private:
    std::set<std::string> failing_;
    std::atomic<int> calls_{0};
};

class StaticSupplemental : public ISupplementalSource {
public:
    explicit StaticSupplemental(std::vector<ServerDescriptor> servers)
        : servers_(std::move(servers)) {}
    std::vector<ServerDescriptor> discover() override { return servers_; }

private:
    std::vector<ServerDescriptor> servers_;
};

const ServerDescriptor* byName(const ConfigSource& src, const std::string& name) {
    return src.findServer(name);
}

} // namespace

class DiscoveryEngineTest : public ::testing::Test {
protected:
    TempDirScope tmp_ = TempDirScope::unique_under("mcplex-discovery");
};

TEST_F(DiscoveryEngineTest, SameNameInTwoSourcesStaysDistinct) {
    auto a = tmp_.write("A.json", R"({"mcpServers": {"foo": {"command": "run-foo"}}})");
    auto b = tmp_.write("B.json",
                        R"({"mcpServers": {"foo": {"type": "sse", "url": "http://h/sse"}}})");

    DiscoveryEngine engine(SourceLoader({a, b}), std::make_shared<FakeProber>());
    auto report = engine.discoverHierarchical();

    ASSERT_EQ(report.sources.size(), 2u);
    EXPECT_EQ(report.sources[0].path, a.string());
    ASSERT_EQ(report.sources[0].servers.size(), 1u);
    EXPECT_EQ(report.sources[0].servers[0].name, "foo");
    EXPECT_EQ(report.sources[0].servers[0].kind, ServerKind::StdIO);

    EXPECT_EQ(report.sources[1].path, b.string());
    ASSERT_EQ(report.sources[1].servers.size(), 1u);
    EXPECT_EQ(report.sources[1].servers[0].name, "foo");
    EXPECT_EQ(report.sources[1].servers[0].kind, ServerKind::Sse);

    auto flat = DiscoveryEngine::flatten(report.sources);
    ASSERT_EQ(flat.size(), 2u);
    EXPECT_EQ(flat[0].name, "foo");
    EXPECT_EQ(flat[1].name, "foo#2");
    EXPECT_EQ(flat[1].originalName, "foo");
}

TEST_F(DiscoveryEngineTest, CollisionRenamesAreRetrievableByCompositeKey) {
    auto a = tmp_.write("A.json", R"({"mcpServers": {"x": {"command": "a"}}})");
    auto b = tmp_.write("B.json", R"({"mcpServers": {"x": {"command": "b"}}})");
    auto c = tmp_.write("C.json", R"({"mcpServers": {"x": {"command": "c"}}})");

    DiscoveryEngine engine(SourceLoader({a, b, c}), nullptr);
    auto flat = engine.discoverFlat();
    ASSERT_EQ(flat.size(), 3u);

    const auto* first = findByKey(flat, a.string(), "x");
    const auto* second = findByKey(flat, b.string(), "x#2");
    const auto* third = findByKey(flat, c.string(), "x#3");
    ASSERT_NE(first, nullptr);
    ASSERT_NE(second, nullptr);
    ASSERT_NE(third, nullptr);
    EXPECT_EQ(second->connection.command, "b");
    EXPECT_EQ(third->connection.command, "c");
    EXPECT_EQ(findByKey(flat, a.string(), "x#2"), nullptr);
}

TEST_F(DiscoveryEngineTest, OneFailedProbeDoesNotAffectSiblings) {
    auto s = tmp_.write("S.json", R"({"mcpServers": {
        "alpha": {"command": "a"},
        "beta": {"command": "b"},
        "gamma": {"command": "c"}
    }})");

    auto prober = std::make_shared<FakeProber>(std::set<std::string>{"beta"});
    DiscoveryEngine engine(SourceLoader({s}), prober);
    auto report = engine.discoverHierarchical();

    ASSERT_EQ(report.sources.size(), 1u);
    const auto& src = report.sources[0];
    ASSERT_EQ(src.servers.size(), 3u);
    EXPECT_EQ(prober->calls(), 3);

    int connected = 0;
    int errors = 0;
    for (const auto& server : src.servers) {
        if (server.status == ServerStatus::Connected)
            ++connected;
        if (server.status == ServerStatus::Error)
            ++errors;
    }
    EXPECT_EQ(connected, 2);
    EXPECT_EQ(errors, 1);

    const auto* beta = byName(src, "beta");
    ASSERT_NE(beta, nullptr);
    EXPECT_EQ(beta->status, ServerStatus::Error);
    EXPECT_EQ(beta->errorMessage.value_or(""), "Connection refused");

    // Identity belongs to the engine, not the prober
    const auto* alpha = byName(src, "alpha");
    ASSERT_NE(alpha, nullptr);
    EXPECT_EQ(alpha->sourcePath, s.string());
    ASSERT_EQ(alpha->tools.size(), 1u);
}

TEST_F(DiscoveryEngineTest, ThrowingProberBecomesErrorStatus) {
    auto s = tmp_.write("S.json", R"({"mcpServers": {
        "throwing": {"command": "a"},
        "fine": {"command": "b"}
    }})");

    DiscoveryEngine engine(SourceLoader({s}), std::make_shared<FakeProber>());
    auto report = engine.discoverHierarchical();
    ASSERT_EQ(report.sources.size(), 1u);

    const auto* throwing = byName(report.sources[0], "throwing");
    ASSERT_NE(throwing, nullptr);
    EXPECT_EQ(throwing->status, ServerStatus::Error);
    EXPECT_EQ(throwing->errorMessage.value_or(""), "Initialization failed: boom");

    const auto* fine = byName(report.sources[0], "fine");
    ASSERT_NE(fine, nullptr);
    EXPECT_EQ(fine->status, ServerStatus::Connected);
}

TEST_F(DiscoveryEngineTest, InvalidEntriesAreNotProbed) {
    auto s = tmp_.write("S.json", R"({"mcpServers": {
        "ok": {"command": "a"},
        "nourl": {"type": "http"},
        "scalar": 7
    }})");

    auto prober = std::make_shared<FakeProber>();
    DiscoveryEngine engine(SourceLoader({s}), prober);
    auto report = engine.discoverHierarchical();

    ASSERT_EQ(report.sources.size(), 1u);
    EXPECT_EQ(report.sources[0].servers.size(), 3u);
    EXPECT_EQ(prober->calls(), 1);

    const auto* nourl = byName(report.sources[0], "nourl");
    ASSERT_NE(nourl, nullptr);
    EXPECT_EQ(nourl->errorMessage.value_or(""), "http server must have 'url' field");
    const auto* scalar = byName(report.sources[0], "scalar");
    ASSERT_NE(scalar, nullptr);
    EXPECT_EQ(scalar->errorMessage.value_or(""), "server entry must be an object");
}

TEST_F(DiscoveryEngineTest, UnparsableSourceIsSkippedButRunContinues) {
    auto broken = tmp_.write("broken.json", "{{{");
    auto good = tmp_.write("good.json", R"({"mcpServers": {"foo": {"command": "x"}}})");

    DiscoveryEngine engine(SourceLoader({broken, good}), nullptr);
    auto report = engine.discoverHierarchical();

    ASSERT_EQ(report.sources.size(), 1u);
    EXPECT_EQ(report.sources[0].path, good.string());
    ASSERT_EQ(report.skipped.size(), 1u);
    EXPECT_EQ(report.skipped[0].path, broken.string());
}

TEST_F(DiscoveryEngineTest, ValidateOnlyModeLeavesServersDisconnected) {
    auto s = tmp_.write("S.json", R"({"mcpServers": {"foo": {"command": "x"}}})");
    DiscoveryEngine engine(SourceLoader({s}), nullptr);
    auto report = engine.discoverHierarchical();
    ASSERT_EQ(report.sources.size(), 1u);
    EXPECT_EQ(report.sources[0].servers[0].status, ServerStatus::Disconnected);
}

TEST_F(DiscoveryEngineTest, SupplementalServersOnlyFillGaps) {
    auto s = tmp_.write("S.json", R"({"mcpServers": {"shared": {"command": "x"}}})");

    ServerDescriptor shadowed;
    shadowed.name = "shared";
    shadowed.sourcePath = "/other/client.json";
    ServerDescriptor extra;
    extra.name = "extra";
    extra.sourcePath = "/other/client.json";

    DiscoveryEngine engine(SourceLoader({s}), nullptr);
    engine.addSupplementalSource(
        std::make_shared<StaticSupplemental>(std::vector<ServerDescriptor>{shadowed, extra}));

    auto flat = engine.discoverFlat();
    ASSERT_EQ(flat.size(), 2u);
    EXPECT_EQ(flat[0].name, "shared");
    EXPECT_EQ(flat[0].sourcePath, s.string());
    EXPECT_EQ(flat[1].name, "extra");
}

TEST_F(DiscoveryEngineTest, RefreshServerReprobesCopy) {
    auto prober = std::make_shared<FakeProber>();
    DiscoveryEngine engine(SourceLoader(std::vector<std::filesystem::path>{}), prober);

    ServerDescriptor stale;
    stale.name = "foo#2";
    stale.originalName = "foo";
    stale.sourcePath = "/cfg/B.json";
    stale.markError("old failure");

    auto fresh = engine.refreshServer(stale);
    EXPECT_EQ(fresh.status, ServerStatus::Connected);
    EXPECT_EQ(fresh.name, "foo#2");
    EXPECT_EQ(fresh.originalName, "foo");
    EXPECT_FALSE(fresh.errorMessage.has_value());
    EXPECT_EQ(stale.status, ServerStatus::Error);
}

TEST(RenameCollisionsTest, RenamesRepeatsAndLeavesUniqueNamesAlone) {
    ServerDescriptor a;
    a.name = "x";
    a.sourcePath = "/a.json";
    ServerDescriptor b = a;
    b.sourcePath = "/b.json";
    ServerDescriptor c;
    c.name = "y";
    c.sourcePath = "/a.json";

    auto renamed = DiscoveryEngine::renameCollisions({a, c, b});
    ASSERT_EQ(renamed.size(), 3u);
    EXPECT_EQ(renamed[0].name, "x");
    EXPECT_EQ(renamed[1].name, "y");
    EXPECT_EQ(renamed[2].name, "x#2");
    EXPECT_EQ(renamed[2].originalName, "x");

    // Running it again over its own output changes nothing
    auto again = DiscoveryEngine::renameCollisions(renamed);
    EXPECT_EQ(again[2].name, "x#2");
    EXPECT_EQ(again[2].originalName, "x");
}
