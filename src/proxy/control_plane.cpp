#include <mcplex/config/config_helpers.h>
#include <mcplex/discovery/discovery_engine.h>
#include <mcplex/proxy/control_plane.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <chrono>

namespace mcplex::proxy {

using discovery::CapabilityKind;
using discovery::ServerStatus;

namespace {

constexpr std::string_view kUnknownServer = "unknown";

const std::string& declaredName(const ServerDescriptor& s) {
    return s.originalName.empty() ? s.name : s.originalName;
}

bool matchesType(const json& value, const std::string& type) {
    if (type == "string")
        return value.is_string();
    if (type == "integer")
        return value.is_number_integer();
    if (type == "number")
        return value.is_number();
    if (type == "boolean")
        return value.is_boolean();
    if (type == "object")
        return value.is_object();
    if (type == "array")
        return value.is_array();
    if (type == "null")
        return value.is_null();
    return true;
}

double elapsedMs(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start)
        .count();
}

} // namespace

std::string prefixToolName(std::string_view server, std::string_view tool) {
    return fmt::format("{}_{}", server, tool);
}

std::string prefixResourceUri(std::string_view server, std::string_view uri) {
    return fmt::format("{}://{}", server, uri);
}

std::filesystem::path defaultLogDirectory() {
    return config::get_data_dir() / "proxy-logs";
}

const ForwardedServer* ForwardingSet::findServer(std::string_view name) const {
    for (const auto& f : servers) {
        if (f.server.name == name)
            return &f;
    }
    return nullptr;
}

json ForwardingSet::toJson() const {
    json out = json::array();
    for (const auto& f : servers) {
        json tools = json::array();
        for (const auto& t : f.tools)
            tools.push_back(prefixToolName(f.server.name, t.id));
        json resources = json::array();
        for (const auto& r : f.resources)
            resources.push_back(prefixResourceUri(f.server.name, r.id));
        json prompts = json::array();
        for (const auto& p : f.prompts)
            prompts.push_back(prefixToolName(f.server.name, p.id));
        out.push_back({{"name", f.server.name},
                       {"source", f.server.sourcePath},
                       {"tools", std::move(tools)},
                       {"resources", std::move(resources)},
                       {"prompts", std::move(prompts)}});
    }
    return out;
}

ProxyControlPlane::ProxyControlPlane(EnablementStore& store, OperationLog& log,
                                     std::shared_ptr<ITransportExecutor> executor,
                                     ControlPlaneOptions options)
    : store_(store),
      log_(log),
      executor_(std::move(executor)),
      options_(std::move(options)),
      elicitation_(options_.elicitation) {}

ProxyControlPlane::~ProxyControlPlane() {
    try {
        stop();
    } catch (const std::exception& e) {
        spdlog::warn("[ProxyControlPlane] Shutdown failed: {}", e.what());
    }
}

ForwardingSet
ProxyControlPlane::buildForwardingSet(const std::vector<ServerDescriptor>& servers) const {
    ForwardingSet set;
    // Forwarded names must be unique or their routes would collide.
    for (const auto& s : discovery::DiscoveryEngine::renameCollisions(servers)) {
        if (s.status != ServerStatus::Connected)
            continue;
        const auto& declared = declaredName(s);
        if (!store_.isServerEnabled(s.sourcePath, declared))
            continue;

        ForwardedServer fwd;
        fwd.server = s;
        auto collect = [&](CapabilityKind kind, std::vector<CapabilityDescriptor>& into,
                           std::map<std::string, ForwardingSet::Route>& routes) {
            for (const auto& cap : s.capabilities(kind)) {
                if (!store_.isCapabilityEnabled(kind, s.sourcePath, declared, cap.id))
                    continue;
                into.push_back(cap);
                const auto exposed = kind == CapabilityKind::Resource
                                         ? prefixResourceUri(s.name, cap.id)
                                         : prefixToolName(s.name, cap.id);
                routes[exposed] = ForwardingSet::Route{s.name, cap};
            }
        };
        collect(CapabilityKind::Tool, fwd.tools, set.tools);
        collect(CapabilityKind::Resource, fwd.resources, set.resources);
        collect(CapabilityKind::Prompt, fwd.prompts, set.prompts);
        set.servers.push_back(std::move(fwd));
    }
    return set;
}

ForwardingSet ProxyControlPlane::buildForwardingSet(const std::vector<ConfigSource>& sources) const {
    return buildForwardingSet(discovery::DiscoveryEngine::flatten(sources));
}

Result<void> ProxyControlPlane::start(const std::vector<ServerDescriptor>& servers) {
    if (!executor_)
        return Error{ErrorCode::NotInitialized, "No transport executor configured"};
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (running_)
            return Error{ErrorCode::InvalidState, "Proxy is already running"};
    }

    const auto settings = store_.settings();
    log_.setCapacity(settings.maxLogEntries);
    limiter_.setRate(settings.rateLimit.value_or(0.0));

    if (options_.logDir) {
        const auto epoch = std::chrono::duration_cast<std::chrono::seconds>(
                               std::chrono::system_clock::now().time_since_epoch())
                               .count();
        log_.setPersistPath(*options_.logDir / fmt::format("proxy-{}.jsonl", epoch));
    }

    auto set = buildForwardingSet(servers);
    std::vector<std::string> failed;
    for (const auto& fwd : set.servers) {
        auto r = executor_->connect(fwd.server);
        if (!r) {
            failed.push_back(fwd.server.name);
            reportError(fmt::format("Failed to open session for {}: {}", fwd.server.name,
                                    r.error().message),
                        json{{"server", fwd.server.name}, {"source", fwd.server.sourcePath}});
            continue;
        }
        if (!sessions_.insert(fwd.server.name, BackendSession{fwd.server.sourcePath,
                                                              std::chrono::system_clock::now()})) {
            // The executor keys sessions by name, so neither copy can be trusted.
            sessions_.remove(fwd.server.name);
            executor_->disconnect(fwd.server.name);
            failed.push_back(fwd.server.name);
            reportError(fmt::format("Session for {} is already open", fwd.server.name),
                        json{{"server", fwd.server.name}, {"source", fwd.server.sourcePath}});
        }
    }
    for (const auto& name : failed) {
        std::erase_if(set.servers, [&](const ForwardedServer& f) { return f.server.name == name; });
        auto sameServer = [&](const auto& kv) { return kv.second.serverName == name; };
        std::erase_if(set.tools, sameServer);
        std::erase_if(set.resources, sameServer);
        std::erase_if(set.prompts, sameServer);
    }

    std::size_t enabledCount = 0;
    for (const auto& s : servers) {
        if (store_.isServerEnabled(s.sourcePath, declaredName(s)))
            ++enabledCount;
    }

    const auto forwardedServers = set.servers.size();
    const auto forwardedCapabilities = set.capabilityCount();
    {
        std::lock_guard<std::mutex> lk(mu_);
        forwarding_ = std::move(set);
        running_ = true;
    }

    spdlog::info("[ProxyControlPlane] Forwarding {} capabilities from {} servers on port {}",
                 forwardedCapabilities, forwardedServers, settings.port);
    if (loggingOn()) {
        log_.recordServerStarted(
            settings.port, enabledCount,
            fmt::format("Proxy server starting on http://localhost:{} with {} enabled servers",
                        settings.port, enabledCount));
    }
    return {};
}

void ProxyControlPlane::stop() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!running_)
            return;
        running_ = false;
        forwarding_ = ForwardingSet{};
    }

    // A call blocked on the operator must not outlive the proxy.
    elicitation_.cancel();

    for (const auto& [name, session] : sessions_.drain()) {
        spdlog::debug("[ProxyControlPlane] Closing session {} ({})", name, session.sourcePath);
        executor_->disconnect(name);
    }

    if (loggingOn())
        log_.recordServerStopped("Proxy server shutting down");
    spdlog::info("[ProxyControlPlane] Stopped");
}

bool ProxyControlPlane::running() const {
    std::lock_guard<std::mutex> lk(mu_);
    return running_;
}

void ProxyControlPlane::reportError(const std::string& error, json details) {
    spdlog::error("[ProxyControlPlane] {}", error);
    if (loggingOn())
        log_.recordServerError(error, std::move(details));
}

void ProxyControlPlane::registerClient(const std::string& clientId,
                                       std::optional<std::string> remoteAddr) {
    if (!clients_.insert(clientId, ClientConnection{remoteAddr.value_or("unknown"),
                                                    std::chrono::system_clock::now()})) {
        spdlog::debug("[ProxyControlPlane] Client {} already registered", clientId);
    }
    if (loggingOn())
        log_.recordClientConnected(clientId, std::move(remoteAddr));
}

void ProxyControlPlane::unregisterClient(const std::string& clientId,
                                         std::optional<std::string> reason) {
    if (!clients_.remove(clientId))
        spdlog::debug("[ProxyControlPlane] Client {} was not registered", clientId);
    if (loggingOn())
        log_.recordClientDisconnected(clientId, std::move(reason));
}

bool ProxyControlPlane::loggingOn() const {
    return store_.settings().loggingOn;
}

Result<void> ProxyControlPlane::admit() {
    if (!limiter_.tryAcquire())
        return Error{ErrorCode::ResourceExhausted, "Rate limit exceeded"};
    return {};
}

Result<json> ProxyControlPlane::forward(CapabilityKind kind, const ForwardingSet::Route& route,
                                        const json& arguments, json& elicitations) {
    ITransportExecutor::ElicitationCallback elicit =
        [this, &elicitations](const std::string& message, const json& schema) {
            auto outcome = elicitation_.elicit(message, schema);
            elicitations.push_back(outcome.record.toJson());
            return outcome;
        };
    // Coordinator history tracks the most recent forwarded call only.
    elicitation_.beginExecution();
    try {
        return executor_->invoke(route.serverName, kind, route.capability.id, arguments, elicit);
    } catch (const std::exception& e) {
        return Error{ErrorCode::InternalError, e.what()};
    }
}

Result<json> ProxyControlPlane::callTool(const std::string& prefixedName, const json& arguments) {
    std::optional<ForwardingSet::Route> route;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!running_)
            return Error{ErrorCode::InvalidState, "Proxy is not running"};
        if (auto it = forwarding_.tools.find(prefixedName); it != forwarding_.tools.end())
            route = it->second;
    }

    const auto start = std::chrono::steady_clock::now();
    const json args = arguments.is_null() ? json::object() : arguments;
    auto [serverName, toolName] = parseToolName(prefixedName);
    if (route) {
        serverName = route->serverName;
        toolName = route->capability.id;
    }

    json elicitations = json::array();
    Result<json> result = Error{ErrorCode::NotFound, "Unknown tool: " + prefixedName};
    if (route) {
        auto admitted = admit();
        auto valid = admitted ? validateArguments(route->capability.inputSchema, args) : admitted;
        if (!valid)
            result = valid.error();
        else
            result = forward(CapabilityKind::Tool, *route, args, elicitations);
    }

    if (loggingOn()) {
        if (result) {
            log_.recordToolCall(serverName, toolName, args, result.value(), std::nullopt,
                                elapsedMs(start), std::move(elicitations));
        } else {
            log_.recordToolCall(serverName, toolName, args, std::nullopt, result.error().message,
                                elapsedMs(start), std::move(elicitations));
        }
    }
    return result;
}

Result<json> ProxyControlPlane::readResource(const std::string& prefixedUri) {
    std::optional<ForwardingSet::Route> route;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!running_)
            return Error{ErrorCode::InvalidState, "Proxy is not running"};
        if (auto it = forwarding_.resources.find(prefixedUri); it != forwarding_.resources.end())
            route = it->second;
    }

    const auto start = std::chrono::steady_clock::now();
    std::string serverName = route ? route->serverName : parseResourceServer(prefixedUri);
    std::string uri = route ? route->capability.id : prefixedUri;

    Result<json> result = Error{ErrorCode::NotFound, "Unknown resource: " + prefixedUri};
    if (route) {
        auto admitted = admit();
        if (!admitted) {
            result = admitted.error();
        } else {
            json ignored = json::array();
            result = forward(CapabilityKind::Resource, *route, json::object(), ignored);
        }
    }

    if (loggingOn()) {
        if (result) {
            log_.recordResourceRead(serverName, uri, result.value(), std::nullopt,
                                    elapsedMs(start));
        } else {
            log_.recordResourceRead(serverName, uri, std::nullopt, result.error().message,
                                    elapsedMs(start));
        }
    }
    return result;
}

Result<json> ProxyControlPlane::getPrompt(const std::string& prefixedName, const json& arguments) {
    std::optional<ForwardingSet::Route> route;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!running_)
            return Error{ErrorCode::InvalidState, "Proxy is not running"};
        if (auto it = forwarding_.prompts.find(prefixedName); it != forwarding_.prompts.end())
            route = it->second;
    }

    const auto start = std::chrono::steady_clock::now();
    const json args = arguments.is_null() ? json::object() : arguments;
    auto [serverName, promptName] = parseToolName(prefixedName);
    if (route) {
        serverName = route->serverName;
        promptName = route->capability.id;
    }

    Result<json> result = Error{ErrorCode::NotFound, "Unknown prompt: " + prefixedName};
    if (route) {
        auto admitted = admit();
        auto valid = admitted ? validateArguments(route->capability.inputSchema, args) : admitted;
        if (!valid) {
            result = valid.error();
        } else {
            json ignored = json::array();
            result = forward(CapabilityKind::Prompt, *route, args, ignored);
        }
    }

    if (loggingOn()) {
        if (result) {
            log_.recordPromptGet(serverName, promptName, args, result.value(), std::nullopt,
                                 elapsedMs(start));
        } else {
            log_.recordPromptGet(serverName, promptName, args, std::nullopt,
                                 result.error().message, elapsedMs(start));
        }
    }
    return result;
}

ForwardingSet ProxyControlPlane::forwardingSet() const {
    std::lock_guard<std::mutex> lk(mu_);
    return forwarding_;
}

std::pair<std::string, std::string> ProxyControlPlane::parseToolName(std::string_view prefixed) {
    const auto pos = prefixed.find('_');
    if (pos == std::string_view::npos || pos + 1 == prefixed.size())
        return {std::string(kUnknownServer), std::string(prefixed)};
    return {std::string(prefixed.substr(0, pos)), std::string(prefixed.substr(pos + 1))};
}

std::string ProxyControlPlane::parseResourceServer(std::string_view prefixedUri) {
    const auto pos = prefixedUri.find("://");
    if (pos == std::string_view::npos)
        return std::string(kUnknownServer);
    const auto scheme = prefixedUri.substr(0, pos);
    if (scheme == "http" || scheme == "https" || scheme == "file" || scheme == "ftp")
        return std::string(kUnknownServer);
    return std::string(scheme);
}

Result<void> ProxyControlPlane::validateArguments(const json& inputSchema, const json& arguments) {
    if (!arguments.is_null() && !arguments.is_object())
        return Error{ErrorCode::ValidationError, "Arguments must be an object"};
    if (!inputSchema.is_object())
        return {};

    const json args = arguments.is_null() ? json::object() : arguments;
    if (auto req = inputSchema.find("required"); req != inputSchema.end() && req->is_array()) {
        for (const auto& name : *req) {
            if (name.is_string() && !args.contains(name.get<std::string>()))
                return Error{ErrorCode::ValidationError,
                             "Missing required argument: " + name.get<std::string>()};
        }
    }

    auto props = inputSchema.find("properties");
    if (props == inputSchema.end() || !props->is_object())
        return {};
    for (const auto& [name, value] : args.items()) {
        auto prop = props->find(name);
        if (prop == props->end() || !prop->is_object())
            continue;
        auto type = prop->find("type");
        if (type == prop->end() || !type->is_string())
            continue;
        if (!matchesType(value, type->get<std::string>()))
            return Error{ErrorCode::ValidationError,
                         fmt::format("Argument '{}' must be of type {}", name,
                                     type->get<std::string>())};
    }
    return {};
}

} // namespace mcplex::proxy
