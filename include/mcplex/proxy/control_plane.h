#pragma once

#include <mcplex/core/types.h>
#include <mcplex/discovery/server_descriptor.h>
#include <mcplex/proxy/connection_table.h>
#include <mcplex/proxy/elicitation.h>
#include <mcplex/proxy/enablement_store.h>
#include <mcplex/proxy/operation_log.h>
#include <mcplex/proxy/rate_limiter.h>
#include <mcplex/proxy/transport_executor.h>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mcplex::proxy {

using json = nlohmann::json;
using discovery::CapabilityDescriptor;
using discovery::ConfigSource;
using discovery::ServerDescriptor;

// A connected, enabled server and the capabilities exposed for it.
struct ForwardedServer {
    ServerDescriptor server;
    std::vector<CapabilityDescriptor> tools;
    std::vector<CapabilityDescriptor> resources;
    std::vector<CapabilityDescriptor> prompts;
};

struct ForwardingSet {
    std::vector<ForwardedServer> servers;

    // Where a prefixed name points.
    struct Route {
        std::string serverName;
        CapabilityDescriptor capability;
    };

    std::map<std::string, Route> tools;
    std::map<std::string, Route> resources;
    std::map<std::string, Route> prompts;

    const ForwardedServer* findServer(std::string_view name) const;
    std::size_t capabilityCount() const { return tools.size() + resources.size() + prompts.size(); }

    json toJson() const;
};

std::string prefixToolName(std::string_view server, std::string_view tool);
std::string prefixResourceUri(std::string_view server, std::string_view uri);

// <data dir>/proxy-logs, where session logs are written by default.
std::filesystem::path defaultLogDirectory();

struct ControlPlaneOptions {
    // When set, start() points the operation log at <logDir>/proxy-<epoch>.jsonl.
    std::optional<std::filesystem::path> logDir;
    ElicitationOptions elicitation;
};

struct ClientConnection {
    std::string remoteAddr;
    TimePoint connectedAt{};
};

struct BackendSession {
    std::string sourcePath;
    TimePoint openedAt{};
};

/**
 * Decides which discovered capabilities are forwarded and routes calls to them.
 *
 * Forwarded names are prefixed with the server name: tools and prompts as
 * "<server>_<name>", resources as "<server>://<uri>". Every forwarded call, rejected or
 * not, is recorded in the operation log unless logging is switched off in the settings.
 */
class ProxyControlPlane {
public:
    ProxyControlPlane(EnablementStore& store, OperationLog& log,
                      std::shared_ptr<ITransportExecutor> executor,
                      ControlPlaneOptions options = {});
    ~ProxyControlPlane();

    ProxyControlPlane(const ProxyControlPlane&) = delete;
    ProxyControlPlane& operator=(const ProxyControlPlane&) = delete;

    // Enabled, Connected servers only; capabilities must be individually enabled.
    ForwardingSet buildForwardingSet(const std::vector<ServerDescriptor>& servers) const;
    ForwardingSet buildForwardingSet(const std::vector<ConfigSource>& sources) const;

    /**
     * Builds the forwarding set, opens a backend session per forwarded server and records
     * ServerStarted. Servers whose session fails to open are reported and left out.
     */
    Result<void> start(const std::vector<ServerDescriptor>& servers);
    void stop();
    bool running() const;

    void reportError(const std::string& error, json details = json::object());

    void registerClient(const std::string& clientId,
                        std::optional<std::string> remoteAddr = std::nullopt);
    void unregisterClient(const std::string& clientId,
                          std::optional<std::string> reason = std::nullopt);
    std::size_t connectedClientCount() const { return clients_.size(); }

    Result<json> callTool(const std::string& prefixedName, const json& arguments);
    Result<json> readResource(const std::string& prefixedUri);
    Result<json> getPrompt(const std::string& prefixedName, const json& arguments);

    ForwardingSet forwardingSet() const;
    std::vector<std::string> openSessions() const { return sessions_.keys(); }
    ElicitationCoordinator& elicitation() { return elicitation_; }

    // Splits "<server>_<tool>" at the first '_'; no prefix yields server "unknown".
    static std::pair<std::string, std::string> parseToolName(std::string_view prefixed);
    // Server part of "<server>://<uri>"; standard URL schemes yield "unknown".
    static std::string parseResourceServer(std::string_view prefixedUri);

    // Required properties present and primitive JSON types match the schema.
    static Result<void> validateArguments(const json& inputSchema, const json& arguments);

private:
    bool loggingOn() const;
    Result<void> admit();
    Result<json> forward(discovery::CapabilityKind kind, const ForwardingSet::Route& route,
                         const json& arguments, json& elicitations);

    EnablementStore& store_;
    OperationLog& log_;
    std::shared_ptr<ITransportExecutor> executor_;
    ControlPlaneOptions options_;

    mutable std::mutex mu_;
    ForwardingSet forwarding_;
    bool running_{false};

    RequestRateLimiter limiter_;
    ElicitationCoordinator elicitation_;
    ConnectionTable<std::string, ClientConnection> clients_;
    ConnectionTable<std::string, BackendSession> sessions_;
};

} // namespace mcplex::proxy
