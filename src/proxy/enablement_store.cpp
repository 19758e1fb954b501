#include <mcplex/config/config_helpers.h>
#include <mcplex/proxy/enablement_store.h>

#include <spdlog/spdlog.h>

#include <fstream>

namespace mcplex::proxy {

namespace {

using CapabilityMap = std::map<std::string, std::set<std::string>>;

json mapToJson(const CapabilityMap& m) {
    json out = json::object();
    for (const auto& [key, ids] : m)
        out[key] = ids;
    return out;
}

bool mapFromJson(const json& j, const char* field, CapabilityMap& out, std::string& err) {
    auto it = j.find(field);
    if (it == j.end())
        return true;
    if (!it->is_object()) {
        err = std::string("'") + field + "' must be an object";
        return false;
    }
    for (const auto& [key, ids] : it->items()) {
        if (!ids.is_array()) {
            err = std::string("'") + field + "." + key + "' must be a list";
            return false;
        }
        auto& set = out[key];
        for (const auto& id : ids) {
            if (!id.is_string()) {
                err = std::string("'") + field + "." + key + "' must contain strings";
                return false;
            }
            set.insert(id.get<std::string>());
        }
    }
    return true;
}

bool contains(const CapabilityMap& m, const std::string& key, std::string_view capId) {
    auto it = m.find(key);
    if (it == m.end())
        return false;
    return it->second.find(std::string(capId)) != it->second.end();
}

} // namespace

CapabilityMap& EnablementRecord::capabilityMap(CapabilityKind kind) {
    switch (kind) {
        case CapabilityKind::Resource:
            return enabledResources;
        case CapabilityKind::Prompt:
            return enabledPrompts;
        case CapabilityKind::Tool:
            break;
    }
    return enabledTools;
}

const CapabilityMap& EnablementRecord::capabilityMap(CapabilityKind kind) const {
    return const_cast<EnablementRecord*>(this)->capabilityMap(kind);
}

json EnablementRecord::toJson() const {
    json j{{"version", 1},
           {"enabled", globalSettings.enabled},
           {"port", globalSettings.port},
           {"enable_logging", globalSettings.loggingOn},
           {"max_log_entries", globalSettings.maxLogEntries},
           {"enabled_servers", enabledServers},
           {"enabled_tools", mapToJson(enabledTools)},
           {"enabled_resources", mapToJson(enabledResources)},
           {"enabled_prompts", mapToJson(enabledPrompts)}};
    if (globalSettings.rateLimit)
        j["rate_limit"] = *globalSettings.rateLimit;
    return j;
}

Result<EnablementRecord> EnablementRecord::fromJson(const json& j) {
    if (!j.is_object())
        return Error{ErrorCode::CorruptedData, "Proxy config must be a JSON object"};

    EnablementRecord r;
    try {
        auto& g = r.globalSettings;
        g.enabled = j.value("enabled", g.enabled);
        g.port = j.value("port", g.port);
        g.loggingOn = j.value("enable_logging", g.loggingOn);
        g.maxLogEntries = j.value("max_log_entries", g.maxLogEntries);
        if (auto it = j.find("rate_limit"); it != j.end() && !it->is_null())
            g.rateLimit = it->get<double>();

        if (auto it = j.find("enabled_servers"); it != j.end()) {
            if (!it->is_array())
                return Error{ErrorCode::CorruptedData, "'enabled_servers' must be a list"};
            for (const auto& key : *it)
                r.enabledServers.insert(key.get<std::string>());
        }
    } catch (const json::exception& e) {
        return Error{ErrorCode::CorruptedData, std::string("Invalid proxy config: ") + e.what()};
    }

    std::string err;
    if (!mapFromJson(j, "enabled_tools", r.enabledTools, err) ||
        !mapFromJson(j, "enabled_resources", r.enabledResources, err) ||
        !mapFromJson(j, "enabled_prompts", r.enabledPrompts, err)) {
        return Error{ErrorCode::CorruptedData, err};
    }
    return r;
}

EnablementStore::EnablementStore(std::filesystem::path path) : path_(std::move(path)) {}

EnablementStore::EnablementStore() : EnablementStore(defaultPath()) {}

std::filesystem::path EnablementStore::defaultPath() {
    return config::get_config_dir() / "proxy-config.json";
}

bool EnablementStore::isServerEnabled(std::string_view sourcePath, std::string_view name) const {
    std::lock_guard<std::mutex> lk(mu_);
    if (record_.enabledServers.empty())
        return true;
    return record_.enabledServers.count(discovery::makeServerKey(sourcePath, name)) > 0;
}

bool EnablementStore::isCapabilityEnabled(CapabilityKind kind, std::string_view sourcePath,
                                          std::string_view name, std::string_view capId) const {
    std::lock_guard<std::mutex> lk(mu_);
    return contains(record_.capabilityMap(kind), discovery::makeServerKey(sourcePath, name),
                    capId);
}

bool EnablementStore::isToolEnabled(std::string_view sourcePath, std::string_view name,
                                    std::string_view toolName) const {
    return isCapabilityEnabled(CapabilityKind::Tool, sourcePath, name, toolName);
}

bool EnablementStore::isResourceEnabled(std::string_view sourcePath, std::string_view name,
                                        std::string_view uri) const {
    return isCapabilityEnabled(CapabilityKind::Resource, sourcePath, name, uri);
}

bool EnablementStore::isPromptEnabled(std::string_view sourcePath, std::string_view name,
                                      std::string_view promptName) const {
    return isCapabilityEnabled(CapabilityKind::Prompt, sourcePath, name, promptName);
}

void EnablementStore::enableAllForServer(std::string_view sourcePath, std::string_view name) {
    const auto key = discovery::makeServerKey(sourcePath, name);
    std::lock_guard<std::mutex> lk(mu_);
    record_.enabledServers.insert(key);
    record_.enabledTools.erase(key);
    record_.enabledResources.erase(key);
    record_.enabledPrompts.erase(key);
}

void EnablementStore::disableServer(std::string_view sourcePath, std::string_view name) {
    std::lock_guard<std::mutex> lk(mu_);
    record_.enabledServers.erase(discovery::makeServerKey(sourcePath, name));
}

void EnablementStore::setCapabilityEnabled(CapabilityKind kind, std::string_view sourcePath,
                                           std::string_view name, std::string_view capId,
                                           bool enabled) {
    const auto key = discovery::makeServerKey(sourcePath, name);
    std::lock_guard<std::mutex> lk(mu_);
    auto& map = record_.capabilityMap(kind);
    if (enabled) {
        map[key].insert(std::string(capId));
        return;
    }
    // The key is kept even when its set empties: an empty set still means "restricted".
    if (auto it = map.find(key); it != map.end())
        it->second.erase(std::string(capId));
}

GlobalSettings EnablementStore::settings() const {
    std::lock_guard<std::mutex> lk(mu_);
    return record_.globalSettings;
}

void EnablementStore::updateSettings(const GlobalSettings& settings) {
    std::lock_guard<std::mutex> lk(mu_);
    record_.globalSettings = settings;
}

EnablementRecord EnablementStore::snapshot() const {
    std::lock_guard<std::mutex> lk(mu_);
    return record_;
}

void EnablementStore::replace(EnablementRecord record) {
    std::lock_guard<std::mutex> lk(mu_);
    record_ = std::move(record);
}

EnablementRecord EnablementStore::load() {
    EnablementRecord loaded;
    std::optional<Error> failure;

    std::error_code ec;
    if (std::filesystem::exists(path_, ec)) {
        std::ifstream in(path_);
        if (!in) {
            failure = Error{ErrorCode::PermissionDenied, "Cannot read " + path_.string()};
        } else {
            try {
                json j;
                in >> j;
                auto parsed = EnablementRecord::fromJson(j);
                if (parsed)
                    loaded = std::move(parsed).value();
                else
                    failure = parsed.error();
            } catch (const json::exception& e) {
                failure = Error{ErrorCode::CorruptedData,
                                std::string("Corrupt proxy config: ") + e.what()};
            }
        }
    }

    if (failure) {
        spdlog::warn("[EnablementStore] Error loading proxy config {}: {} (using defaults)",
                     path_.string(), failure->message);
        loaded = EnablementRecord{};
    }

    std::lock_guard<std::mutex> lk(mu_);
    lastLoadError_ = std::move(failure);
    record_ = loaded;
    return loaded;
}

Result<void> EnablementStore::save() const {
    return save(snapshot());
}

Result<void> EnablementStore::save(const EnablementRecord& record) const {
    // Serialize first: keys that are not valid UTF-8 cannot be stored faithfully.
    std::string text;
    try {
        text = record.toJson().dump(2);
    } catch (const json::exception& e) {
        spdlog::warn("[EnablementStore] Cannot serialize proxy config: {}", e.what());
        return Error{ErrorCode::WriteError,
                     std::string("Cannot serialize proxy config: ") + e.what()};
    }

    std::error_code ec;
    if (path_.has_parent_path())
        std::filesystem::create_directories(path_.parent_path(), ec);

    auto tempPath = path_;
    tempPath += ".tmp";

    {
        std::ofstream ofs(tempPath, std::ios::trunc);
        if (!ofs) {
            spdlog::warn("[EnablementStore] Cannot open {} for writing", tempPath.string());
            return Error{ErrorCode::WriteError, "Cannot write " + tempPath.string()};
        }
        ofs << text;
        ofs.close();
        if (!ofs) {
            std::filesystem::remove(tempPath, ec);
            return Error{ErrorCode::WriteError, "Failed writing " + tempPath.string()};
        }
    }

    std::filesystem::rename(tempPath, path_, ec);
    if (ec) {
        spdlog::warn("[EnablementStore] Error saving proxy config {}: {}", path_.string(),
                     ec.message());
        std::error_code ignore;
        std::filesystem::remove(tempPath, ignore);
        return Error{ErrorCode::WriteError, "Failed to replace " + path_.string() + ": " +
                                                ec.message()};
    }
    return Result<void>();
}

} // namespace mcplex::proxy
