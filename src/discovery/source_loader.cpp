#include <mcplex/discovery/source_loader.h>

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace mcplex::discovery {

namespace {

// Skips whitespace and comments starting at i; returns the index of the next significant char.
size_t skipInsignificant(const std::string& text, size_t i) {
    while (i < text.size()) {
        const char c = text[i];
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            ++i;
        } else if (c == '/' && i + 1 < text.size() && text[i + 1] == '/') {
            i = text.find('\n', i);
            if (i == std::string::npos)
                return text.size();
        } else if (c == '/' && i + 1 < text.size() && text[i + 1] == '*') {
            i = text.find("*/", i + 2);
            if (i == std::string::npos)
                return text.size();
            i += 2;
        } else {
            break;
        }
    }
    return i;
}

std::string stripTrailingCommas(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool inString = false;
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (inString) {
            out.push_back(c);
            if (c == '\\' && i + 1 < text.size()) {
                out.push_back(text[++i]);
            } else if (c == '"') {
                inString = false;
            }
            continue;
        }
        if (c == '"') {
            inString = true;
        } else if (c == '/' && i + 1 < text.size() && (text[i + 1] == '/' || text[i + 1] == '*')) {
            size_t end = skipInsignificant(text, i);
            out.append(text, i, end - i);
            i = end - 1;
            continue;
        } else if (c == ',') {
            size_t next = skipInsignificant(text, i + 1);
            if (next < text.size() && (text[next] == '}' || text[next] == ']'))
                continue;
        }
        out.push_back(c);
    }
    return out;
}

} // namespace

void RawSource::upsert(std::string name, json config) {
    for (auto& e : entries) {
        if (e.name == name) {
            spdlog::warn("[Discovery] Duplicate server '{}' in {} (overriding)", name, path);
            e.config = std::move(config);
            return;
        }
    }
    entries.push_back(RawServerEntry{std::move(name), std::move(config)});
}

SourceLoader::SourceLoader(std::vector<std::filesystem::path> locations)
    : locations_(std::move(locations)) {}

Result<json> SourceLoader::parseDocument(const std::string& text) {
    if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
        return Error{ErrorCode::InvalidData, "Empty configuration file"};
    }
    try {
        return json::parse(stripTrailingCommas(text), nullptr, true, /*ignore_comments=*/true);
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::InvalidData,
                     std::string("Invalid JSON at byte ") + std::to_string(e.byte) + ": " +
                         e.what()};
    }
}

Result<RawSource> SourceLoader::fromDocument(std::string path, const json& document) {
    if (!document.is_object()) {
        return Error{ErrorCode::InvalidData, "Config must be a JSON object"};
    }

    const json* servers = &document;
    if (auto it = document.find("mcpServers"); it != document.end()) {
        servers = &*it;
    } else if (auto it2 = document.find("servers"); it2 != document.end()) {
        servers = &*it2;
    }
    if (!servers->is_object()) {
        return Error{ErrorCode::InvalidData, "Invalid servers format"};
    }

    RawSource source;
    source.path = std::move(path);
    for (const auto& [name, config] : servers->items()) {
        source.upsert(name, config);
    }
    return source;
}

Result<RawSource> SourceLoader::loadSource(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::PermissionDenied, "Cannot read file: " + path.string()};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    auto parsed = parseDocument(buffer.str());
    if (!parsed) {
        return parsed.error();
    }
    return fromDocument(path.string(), parsed.value());
}

LoadReport SourceLoader::loadSources() const {
    LoadReport report;
    spdlog::info("[Discovery] Discovering servers from {} candidate location(s)",
                 locations_.size());

    for (const auto& location : locations_) {
        std::error_code ec;
        if (!std::filesystem::exists(location, ec)) {
            spdlog::debug("[Discovery] Skipping missing location {}", location.string());
            continue;
        }

        auto loaded = loadSource(location);
        if (!loaded) {
            spdlog::warn("[Discovery] Config validation failed for {}: {}", location.string(),
                         loaded.error().message);
            report.skipped.push_back(SkippedSource{location.string(), loaded.error()});
            continue;
        }

        auto source = std::move(loaded).value();
        spdlog::info("[Discovery] {}: found {} server(s)", source.path, source.entries.size());
        if (!source.entries.empty()) {
            report.sources.push_back(std::move(source));
        }
    }
    return report;
}

} // namespace mcplex::discovery
