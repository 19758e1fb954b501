#pragma once

#include <mcplex/core/types.h>
#include <mcplex/discovery/server_descriptor.h>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace mcplex::proxy {

using json = nlohmann::json;
using discovery::CapabilityKind;

struct GlobalSettings {
    bool enabled{false};
    int port{3000};
    bool loggingOn{true};
    std::size_t maxLogEntries{1000};
    // Max forwarded requests per second; unset means unlimited.
    std::optional<double> rateLimit;
};

/**
 * Persisted allow-list. Keys are composite "sourcePath:name" server keys.
 *
 * An empty `enabledServers` means no restriction has been configured and every server
 * is enabled. Capabilities have no default: a capability is enabled only when its server
 * key has an entry in the relevant map and the identifier is listed there.
 */
struct EnablementRecord {
    std::set<std::string> enabledServers;
    std::map<std::string, std::set<std::string>> enabledTools;
    std::map<std::string, std::set<std::string>> enabledResources;
    std::map<std::string, std::set<std::string>> enabledPrompts;
    GlobalSettings globalSettings;

    std::map<std::string, std::set<std::string>>& capabilityMap(CapabilityKind kind);
    const std::map<std::string, std::set<std::string>>& capabilityMap(CapabilityKind kind) const;

    json toJson() const;
    static Result<EnablementRecord> fromJson(const json& j);
};

class EnablementStore {
public:
    // Store backed by `path`; nothing is read until load() is called.
    explicit EnablementStore(std::filesystem::path path);
    // Store backed by the default location under the user config directory.
    EnablementStore();

    static std::filesystem::path defaultPath();

    bool isServerEnabled(std::string_view sourcePath, std::string_view name) const;
    bool isToolEnabled(std::string_view sourcePath, std::string_view name,
                       std::string_view toolName) const;
    bool isResourceEnabled(std::string_view sourcePath, std::string_view name,
                           std::string_view uri) const;
    bool isPromptEnabled(std::string_view sourcePath, std::string_view name,
                         std::string_view promptName) const;
    bool isCapabilityEnabled(CapabilityKind kind, std::string_view sourcePath,
                             std::string_view name, std::string_view capId) const;

    /**
     * Adds the server key and drops its per-capability maps. Capabilities stay disabled
     * until each one is added again with setCapabilityEnabled().
     */
    void enableAllForServer(std::string_view sourcePath, std::string_view name);

    // Removes the server key only; capability choices survive for a later re-enable.
    void disableServer(std::string_view sourcePath, std::string_view name);

    void setCapabilityEnabled(CapabilityKind kind, std::string_view sourcePath,
                              std::string_view name, std::string_view capId, bool enabled);

    GlobalSettings settings() const;
    void updateSettings(const GlobalSettings& settings);

    EnablementRecord snapshot() const;
    void replace(EnablementRecord record);

    /**
     * Reads the persisted record and makes it current. A missing file yields defaults; an
     * unreadable or corrupt file is reported through `lastLoadError()` and also yields
     * defaults.
     */
    EnablementRecord load();

    // Writes the current record; the file is replaced atomically via rename.
    Result<void> save() const;
    Result<void> save(const EnablementRecord& record) const;

    const std::optional<Error>& lastLoadError() const { return lastLoadError_; }
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    mutable std::mutex mu_;
    EnablementRecord record_;
    std::optional<Error> lastLoadError_;
};

} // namespace mcplex::proxy
