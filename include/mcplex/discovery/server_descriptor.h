#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcplex::discovery {

using json = nlohmann::json;

enum class ServerKind { StdIO, Http, Sse };

enum class ServerStatus { Disconnected, Connected, Error };

enum class CapabilityKind { Tool, Resource, Prompt };

const char* toString(ServerKind kind) noexcept;
const char* toString(ServerStatus status) noexcept;
const char* toString(CapabilityKind kind) noexcept;

// Accepts the configuration spellings "stdio", "http" and "sse".
std::optional<ServerKind> parseServerKind(std::string_view value) noexcept;

// Composite key "sourcePath:name" that disambiguates servers across sources.
std::string makeServerKey(std::string_view sourcePath, std::string_view name);

struct CapabilityParameter {
    std::string name;
    std::string type{"any"};
    std::string description;
    bool required{false};
    std::optional<json> defaultValue;
};

/**
 * A tool, resource or prompt advertised by a backend server.
 * `id` is the tool name, resource URI or prompt name.
 */
struct CapabilityDescriptor {
    CapabilityKind kind{CapabilityKind::Tool};
    std::string id;
    std::string displayName;
    std::string description;
    std::string mimeType;
    json inputSchema = json::object();
    std::vector<CapabilityParameter> parameters;

    static CapabilityDescriptor tool(std::string name, std::string description,
                                     json inputSchema = json::object());
    static CapabilityDescriptor resource(std::string uri, std::string name,
                                         std::string description = {},
                                         std::string mimeType = {});
    static CapabilityDescriptor prompt(std::string name, std::string description,
                                       std::vector<CapabilityParameter> arguments = {});

    json toJson() const;
};

struct ConnectionParams {
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::string url;
    std::map<std::string, std::string> headers;
    std::string description;
};

struct ServerDescriptor {
    std::string name;
    // Name as declared in the source; differs from `name` only in the flattened view.
    std::string originalName;
    ServerKind kind{ServerKind::StdIO};
    ConnectionParams connection;
    ServerStatus status{ServerStatus::Disconnected};
    std::optional<std::string> errorMessage;
    std::vector<CapabilityDescriptor> tools;
    std::vector<CapabilityDescriptor> resources;
    std::vector<CapabilityDescriptor> prompts;
    std::map<std::string, std::string> serverInfo;
    std::string sourcePath;

    std::string compositeKey() const { return makeServerKey(sourcePath, name); }

    void markConnected();
    void markError(std::string message);

    const std::vector<CapabilityDescriptor>& capabilities(CapabilityKind kind) const;

    // "[STDIO] 3 tools, 1 prompts" style summary used by listings.
    std::string capabilitiesSummary() const;

    json toJson() const;
};

struct ConfigSource {
    std::string path;
    std::vector<ServerDescriptor> servers;

    const ServerDescriptor* findServer(std::string_view name) const;
};

// Looks a descriptor up by its composite key in a flattened list.
const ServerDescriptor* findByKey(const std::vector<ServerDescriptor>& servers,
                                  std::string_view sourcePath, std::string_view name);

} // namespace mcplex::discovery
