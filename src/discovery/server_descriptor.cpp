#include <mcplex/discovery/server_descriptor.h>

#include <algorithm>
#include <cctype>

namespace mcplex::discovery {

const char* toString(ServerKind kind) noexcept {
    switch (kind) {
        case ServerKind::StdIO:
            return "stdio";
        case ServerKind::Http:
            return "http";
        case ServerKind::Sse:
            return "sse";
    }
    return "unknown";
}

const char* toString(ServerStatus status) noexcept {
    switch (status) {
        case ServerStatus::Disconnected:
            return "disconnected";
        case ServerStatus::Connected:
            return "connected";
        case ServerStatus::Error:
            return "error";
    }
    return "unknown";
}

const char* toString(CapabilityKind kind) noexcept {
    switch (kind) {
        case CapabilityKind::Tool:
            return "tool";
        case CapabilityKind::Resource:
            return "resource";
        case CapabilityKind::Prompt:
            return "prompt";
    }
    return "unknown";
}

std::optional<ServerKind> parseServerKind(std::string_view value) noexcept {
    if (value == "stdio")
        return ServerKind::StdIO;
    if (value == "http")
        return ServerKind::Http;
    if (value == "sse")
        return ServerKind::Sse;
    return std::nullopt;
}

std::string makeServerKey(std::string_view sourcePath, std::string_view name) {
    std::string key;
    key.reserve(sourcePath.size() + name.size() + 1);
    key.append(sourcePath);
    key.push_back(':');
    key.append(name);
    return key;
}

CapabilityDescriptor CapabilityDescriptor::tool(std::string name, std::string description,
                                                json inputSchema) {
    CapabilityDescriptor d;
    d.kind = CapabilityKind::Tool;
    d.id = std::move(name);
    d.description = std::move(description);
    if (!inputSchema.is_object())
        inputSchema = json::object();

    std::vector<std::string> required;
    if (auto it = inputSchema.find("required"); it != inputSchema.end() && it->is_array()) {
        for (const auto& r : *it) {
            if (r.is_string())
                required.push_back(r.get<std::string>());
        }
    }
    if (auto it = inputSchema.find("properties"); it != inputSchema.end() && it->is_object()) {
        for (const auto& [pname, pschema] : it->items()) {
            CapabilityParameter p;
            p.name = pname;
            if (pschema.is_object()) {
                if (pschema.contains("type") && pschema["type"].is_string())
                    p.type = pschema["type"].get<std::string>();
                if (pschema.contains("description") && pschema["description"].is_string())
                    p.description = pschema["description"].get<std::string>();
                if (pschema.contains("default"))
                    p.defaultValue = pschema["default"];
            }
            p.required = std::find(required.begin(), required.end(), pname) != required.end();
            d.parameters.push_back(std::move(p));
        }
    }
    d.inputSchema = std::move(inputSchema);
    return d;
}

CapabilityDescriptor CapabilityDescriptor::resource(std::string uri, std::string name,
                                                    std::string description,
                                                    std::string mimeType) {
    CapabilityDescriptor d;
    d.kind = CapabilityKind::Resource;
    d.id = std::move(uri);
    d.displayName = std::move(name);
    d.description = std::move(description);
    d.mimeType = std::move(mimeType);
    return d;
}

CapabilityDescriptor CapabilityDescriptor::prompt(std::string name, std::string description,
                                                  std::vector<CapabilityParameter> arguments) {
    CapabilityDescriptor d;
    d.kind = CapabilityKind::Prompt;
    d.id = std::move(name);
    d.description = std::move(description);

    // Prompt arguments are always strings; synthesise a schema so forwarded calls share
    // the same argument validation path as tools.
    json properties = json::object();
    json required = json::array();
    for (auto& arg : arguments) {
        arg.type = "string";
        properties[arg.name] = json{{"type", "string"}, {"description", arg.description}};
        if (arg.required)
            required.push_back(arg.name);
    }
    d.inputSchema = json{{"type", "object"}, {"properties", properties}, {"required", required}};
    d.parameters = std::move(arguments);
    return d;
}

json CapabilityDescriptor::toJson() const {
    json j{{"kind", toString(kind)}, {"id", id}};
    if (!displayName.empty())
        j["name"] = displayName;
    if (!description.empty())
        j["description"] = description;
    if (!mimeType.empty())
        j["mimeType"] = mimeType;
    if (kind != CapabilityKind::Resource)
        j["inputSchema"] = inputSchema;
    return j;
}

void ServerDescriptor::markConnected() {
    status = ServerStatus::Connected;
    errorMessage.reset();
}

void ServerDescriptor::markError(std::string message) {
    status = ServerStatus::Error;
    errorMessage = std::move(message);
}

const std::vector<CapabilityDescriptor>&
ServerDescriptor::capabilities(CapabilityKind capabilityKind) const {
    switch (capabilityKind) {
        case CapabilityKind::Resource:
            return resources;
        case CapabilityKind::Prompt:
            return prompts;
        case CapabilityKind::Tool:
            break;
    }
    return tools;
}

std::string ServerDescriptor::capabilitiesSummary() const {
    std::string kindTag = toString(kind);
    std::transform(kindTag.begin(), kindTag.end(), kindTag.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    std::string parts;
    auto append = [&parts](size_t n, const char* label) {
        if (n == 0)
            return;
        if (!parts.empty())
            parts += ", ";
        parts += std::to_string(n) + " " + label;
    };
    append(tools.size(), "tools");
    append(resources.size(), "resources");
    append(prompts.size(), "prompts");

    return "[" + kindTag + "] " + (parts.empty() ? std::string("No capabilities") : parts);
}

json ServerDescriptor::toJson() const {
    json j{{"name", name},
           {"type", toString(kind)},
           {"status", toString(status)},
           {"source", sourcePath}};
    if (!originalName.empty() && originalName != name)
        j["originalName"] = originalName;
    if (errorMessage)
        j["error"] = *errorMessage;
    if (kind == ServerKind::StdIO) {
        j["command"] = connection.command;
        j["args"] = connection.args;
    } else {
        j["url"] = connection.url;
    }
    if (!connection.description.empty())
        j["description"] = connection.description;

    auto dump = [](const std::vector<CapabilityDescriptor>& caps) {
        json arr = json::array();
        for (const auto& c : caps)
            arr.push_back(c.toJson());
        return arr;
    };
    j["tools"] = dump(tools);
    j["resources"] = dump(resources);
    j["prompts"] = dump(prompts);
    return j;
}

const ServerDescriptor* ConfigSource::findServer(std::string_view serverName) const {
    for (const auto& s : servers) {
        if (s.name == serverName)
            return &s;
    }
    return nullptr;
}

const ServerDescriptor* findByKey(const std::vector<ServerDescriptor>& servers,
                                  std::string_view sourcePath, std::string_view name) {
    for (const auto& s : servers) {
        if (s.sourcePath == sourcePath && s.name == name)
            return &s;
    }
    return nullptr;
}

} // namespace mcplex::discovery
