#include <mcplex/discovery/server_validator.h>

namespace mcplex::discovery {

namespace {

Error invalid(std::string message) {
    return Error{ErrorCode::ValidationError, std::move(message)};
}

std::string scalarToString(const json& v) {
    if (v.is_string())
        return v.get<std::string>();
    return v.dump();
}

std::map<std::string, std::string> toStringMap(const json& obj) {
    std::map<std::string, std::string> out;
    for (const auto& [k, v] : obj.items())
        out[k] = scalarToString(v);
    return out;
}

} // namespace

std::optional<ServerKind> ServerValidator::declaredKind(const json& entry) {
    if (!entry.is_object())
        return std::nullopt;
    auto it = entry.find("type");
    if (it == entry.end())
        return ServerKind::StdIO;
    if (!it->is_string())
        return std::nullopt;
    return parseServerKind(it->get<std::string>());
}

Result<ValidatedEntry> ServerValidator::validate(const std::string& name, const json& entry) {
    if (!entry.is_object()) {
        return invalid("server entry must be an object");
    }

    auto kind = declaredKind(entry);
    if (!kind) {
        const auto& t = entry.at("type");
        return invalid("Invalid server type: " + scalarToString(t));
    }

    ValidatedEntry out;
    out.name = name;
    out.kind = *kind;
    if (auto it = entry.find("description"); it != entry.end() && it->is_string())
        out.connection.description = it->get<std::string>();

    if (*kind == ServerKind::StdIO) {
        auto cmd = entry.find("command");
        if (cmd == entry.end())
            return invalid("stdio server must have 'command' field");
        if (!cmd->is_string())
            return invalid("'command' must be a string");
        out.connection.command = cmd->get<std::string>();
        if (out.connection.command.empty())
            return invalid("No command specified in configuration");

        if (auto args = entry.find("args"); args != entry.end()) {
            if (!args->is_array())
                return invalid("'args' must be a list");
            for (const auto& a : *args)
                out.connection.args.push_back(scalarToString(a));
        }
        if (auto env = entry.find("env"); env != entry.end()) {
            if (!env->is_object())
                return invalid("'env' must be an object");
            out.connection.env = toStringMap(*env);
        }
        return out;
    }

    const std::string kindName = toString(*kind);
    auto url = entry.find("url");
    if (url == entry.end())
        return invalid(kindName + " server must have 'url' field");
    if (!url->is_string())
        return invalid("'url' must be a string");
    out.connection.url = url->get<std::string>();
    if (out.connection.url.empty())
        return invalid("No URL specified in configuration");

    if (auto headers = entry.find("headers"); headers != entry.end()) {
        if (!headers->is_object())
            return invalid("'headers' must be an object");
        out.connection.headers = toStringMap(*headers);
    }
    return out;
}

ServerDescriptor describeEntry(const std::string& sourcePath, const std::string& name,
                               const json& entry) {
    ServerDescriptor server;
    server.name = name;
    server.originalName = name;
    server.sourcePath = sourcePath;

    auto validated = ServerValidator::validate(name, entry);
    if (!validated) {
        if (auto kind = ServerValidator::declaredKind(entry))
            server.kind = *kind;
        server.markError(validated.error().message);
        return server;
    }

    const auto& v = validated.value();
    server.kind = v.kind;
    server.connection = v.connection;
    return server;
}

} // namespace mcplex::discovery
