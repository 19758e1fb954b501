#pragma once

#include <mcplex/core/types.h>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace mcplex::discovery {

using json = nlohmann::json;

struct RawServerEntry {
    std::string name;
    json config;
};

// One parsed configuration location, before validation.
struct RawSource {
    std::string path;
    std::vector<RawServerEntry> entries;

    // Same source, same key: the later declaration replaces the earlier one in place.
    void upsert(std::string name, json config);
};

struct SkippedSource {
    std::string path;
    Error reason;
};

struct LoadReport {
    std::vector<RawSource> sources;
    std::vector<SkippedSource> skipped;
};

/**
 * Reads MCP configuration files. A file that cannot be read or parsed is skipped with a
 * recorded reason; it never aborts loading of the remaining locations.
 */
class SourceLoader {
public:
    explicit SourceLoader(std::vector<std::filesystem::path> locations);

    LoadReport loadSources() const;

    const std::vector<std::filesystem::path>& locations() const { return locations_; }

    // Parses JSON text, tolerating comments and trailing commas.
    static Result<json> parseDocument(const std::string& text);

    static Result<RawSource> loadSource(const std::filesystem::path& path);

    // Extracts the server map ("mcpServers", else "servers", else the root object).
    static Result<RawSource> fromDocument(std::string path, const json& document);

private:
    std::vector<std::filesystem::path> locations_;
};

} // namespace mcplex::discovery
