#include <mcplex/config/config_helpers.h>
#include <mcplex/proxy/operation_log.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <ctime>
#include <fstream>
#include <unordered_set>

namespace mcplex::proxy {

namespace {

constexpr const char* kProxyServerName = "proxy";

std::int64_t toEpochMs(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::string toIso8601(TimePoint tp) {
    const auto ms = toEpochMs(tp);
    const std::time_t secs = static_cast<std::time_t>(ms / 1000);
    std::tm utc{};
    gmtime_r(&secs, &utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &utc);
    return fmt::format("{}.{:03}Z", buf, ms % 1000);
}

// Invalid UTF-8 in backend payloads is replaced rather than thrown on.
std::string dumpLossy(const json& value) {
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

bool containsFolded(const std::string& haystack, const std::string& loweredNeedle) {
    return config::to_lower(haystack).find(loweredNeedle) != std::string::npos;
}

std::string clientIdOf(const LogEntry& e) {
    auto it = e.parameters.find("client_id");
    if (it == e.parameters.end() || !it->is_string())
        return {};
    return it->get<std::string>();
}

} // namespace

const char* toString(LogEntryKind kind) noexcept {
    switch (kind) {
        case LogEntryKind::ToolCall:
            return "tool_call";
        case LogEntryKind::ResourceRead:
            return "resource_read";
        case LogEntryKind::PromptGet:
            return "prompt_get";
        case LogEntryKind::ServerStarted:
            return "server_started";
        case LogEntryKind::ServerStopped:
            return "server_stopped";
        case LogEntryKind::ServerError:
            return "server_error";
        case LogEntryKind::ClientConnected:
            return "client_connected";
        case LogEntryKind::ClientDisconnected:
            return "client_disconnected";
    }
    return "unknown";
}

std::optional<LogEntryKind> parseLogEntryKind(std::string_view value) noexcept {
    static constexpr LogEntryKind kAll[] = {
        LogEntryKind::ToolCall,      LogEntryKind::ResourceRead,    LogEntryKind::PromptGet,
        LogEntryKind::ServerStarted, LogEntryKind::ServerStopped,   LogEntryKind::ServerError,
        LogEntryKind::ClientConnected, LogEntryKind::ClientDisconnected};
    for (auto k : kAll) {
        if (value == toString(k))
            return k;
    }
    return std::nullopt;
}

const char* LogEntry::status() const noexcept {
    if (error)
        return "ERROR";
    if (response)
        return "SUCCESS";
    return "PENDING";
}

json LogEntry::toJson() const {
    json j{{"id", id},
           {"timestamp", toIso8601(timestamp)},
           {"timestamp_ms", toEpochMs(timestamp)},
           {"entry_type", toString(kind)},
           {"server_name", serverName},
           {"operation_name", operationName},
           {"parameters", parameters},
           {"response", response ? *response : json(nullptr)},
           {"error", error ? json(*error) : json(nullptr)},
           {"duration_ms", durationMs ? json(*durationMs) : json(nullptr)}};
    if (!elicitations.empty())
        j["elicitations"] = elicitations;
    return j;
}

Result<LogEntry> LogEntry::fromJson(const json& j) {
    if (!j.is_object())
        return Error{ErrorCode::InvalidData, "log entry must be an object"};
    try {
        LogEntry e;
        auto kind = parseLogEntryKind(j.at("entry_type").get<std::string>());
        if (!kind)
            return Error{ErrorCode::InvalidData, "unknown entry_type"};
        e.kind = *kind;
        e.id = j.value("id", std::string{});
        e.timestamp = TimePoint(std::chrono::milliseconds(j.value("timestamp_ms", std::int64_t{0})));
        e.serverName = j.at("server_name").get<std::string>();
        e.operationName = j.at("operation_name").get<std::string>();
        e.parameters = j.value("parameters", json::object());
        if (auto it = j.find("response"); it != j.end() && !it->is_null())
            e.response = *it;
        if (auto it = j.find("error"); it != j.end() && !it->is_null())
            e.error = it->get<std::string>();
        if (auto it = j.find("duration_ms"); it != j.end() && !it->is_null())
            e.durationMs = it->get<double>();
        if (auto it = j.find("elicitations"); it != j.end() && it->is_array())
            e.elicitations = *it;
        return e;
    } catch (const json::exception& ex) {
        return Error{ErrorCode::InvalidData, ex.what()};
    }
}

OperationLog::OperationLog(std::size_t capacity) : capacity_(std::max<std::size_t>(capacity, 1)) {}

LogEntry OperationLog::recordToolCall(std::string serverName, std::string toolName,
                                      json parameters, std::optional<json> response,
                                      std::optional<std::string> error,
                                      std::optional<double> durationMs, json elicitations) {
    LogEntry e;
    e.kind = LogEntryKind::ToolCall;
    e.serverName = std::move(serverName);
    e.operationName = std::move(toolName);
    e.parameters = std::move(parameters);
    e.response = std::move(response);
    e.error = std::move(error);
    e.durationMs = durationMs;
    e.elicitations = std::move(elicitations);
    return append(std::move(e));
}

LogEntry OperationLog::recordResourceRead(std::string serverName, std::string uri,
                                          std::optional<json> response,
                                          std::optional<std::string> error,
                                          std::optional<double> durationMs) {
    LogEntry e;
    e.kind = LogEntryKind::ResourceRead;
    e.serverName = std::move(serverName);
    e.operationName = std::move(uri);
    e.response = std::move(response);
    e.error = std::move(error);
    e.durationMs = durationMs;
    return append(std::move(e));
}

LogEntry OperationLog::recordPromptGet(std::string serverName, std::string promptName,
                                       json parameters, std::optional<json> response,
                                       std::optional<std::string> error,
                                       std::optional<double> durationMs) {
    LogEntry e;
    e.kind = LogEntryKind::PromptGet;
    e.serverName = std::move(serverName);
    e.operationName = std::move(promptName);
    e.parameters = std::move(parameters);
    e.response = std::move(response);
    e.error = std::move(error);
    e.durationMs = durationMs;
    return append(std::move(e));
}

LogEntry OperationLog::recordServerStarted(int port, std::size_t enabledServers,
                                           std::optional<std::string> message) {
    LogEntry e;
    e.kind = LogEntryKind::ServerStarted;
    e.serverName = kProxyServerName;
    e.operationName = "start";
    e.parameters = json{{"port", port}, {"enabled_servers", enabledServers}};
    e.response = message.value_or("Proxy server started on port " + std::to_string(port));
    return append(std::move(e));
}

LogEntry OperationLog::recordServerStopped(std::optional<std::string> message) {
    LogEntry e;
    e.kind = LogEntryKind::ServerStopped;
    e.serverName = kProxyServerName;
    e.operationName = "stop";
    e.response = message.value_or("Proxy server stopped");
    return append(std::move(e));
}

LogEntry OperationLog::recordServerError(std::string error, json details) {
    LogEntry e;
    e.kind = LogEntryKind::ServerError;
    e.serverName = kProxyServerName;
    e.operationName = "error";
    e.parameters = details.is_object() ? std::move(details) : json::object();
    e.error = std::move(error);
    return append(std::move(e));
}

LogEntry OperationLog::recordClientConnected(const std::string& clientId,
                                             std::optional<std::string> remoteAddr) {
    const std::string addr = remoteAddr.value_or("unknown");
    LogEntry e;
    e.kind = LogEntryKind::ClientConnected;
    e.serverName = kProxyServerName;
    e.operationName = "client_connect";
    e.parameters = json{{"client_id", clientId}, {"remote_addr", addr}};
    e.response = "Client " + clientId + " connected from " + addr;
    return append(std::move(e));
}

LogEntry OperationLog::recordClientDisconnected(const std::string& clientId,
                                                std::optional<std::string> reason) {
    const std::string why = reason.value_or("normal");
    LogEntry e;
    e.kind = LogEntryKind::ClientDisconnected;
    e.serverName = kProxyServerName;
    e.operationName = "client_disconnect";
    e.parameters = json{{"client_id", clientId}, {"reason", why}};
    e.response = "Client " + clientId + " disconnected: " + why;
    return append(std::move(e));
}

void OperationLog::pushLocked(LogEntry entry) {
    entries_.push_back(std::move(entry));
    while (entries_.size() > capacity_)
        entries_.pop_front();
}

LogEntry OperationLog::append(LogEntry entry) {
    std::vector<Subscriber> callbacks;
    {
        std::lock_guard<std::mutex> lk(mu_);
        entry.timestamp = std::chrono::system_clock::now();
        entry.id = std::to_string(toEpochMs(entry.timestamp)) + "-" + std::to_string(++sequence_);
        pushLocked(entry);
        persistLocked(entry);
    }
    {
        std::lock_guard<std::mutex> lk(subscribersMu_);
        callbacks.reserve(subscribers_.size());
        for (const auto& [id, cb] : subscribers_)
            callbacks.push_back(cb);
    }

    for (const auto& cb : callbacks) {
        try {
            cb(entry);
        } catch (const std::exception& e) {
            spdlog::warn("[OperationLog] Subscriber failed for entry {}: {}", entry.id, e.what());
        } catch (...) {
            spdlog::warn("[OperationLog] Subscriber failed for entry {}", entry.id);
        }
    }
    return entry;
}

void OperationLog::persistLocked(const LogEntry& entry) {
    if (!persistPath_)
        return;
    std::ofstream out(*persistPath_, std::ios::app);
    if (!out) {
        spdlog::debug("[OperationLog] Cannot open {} for append", persistPath_->string());
        return;
    }
    try {
        out << dumpLossy(entry.toJson()) << '\n';
    } catch (const json::exception& e) {
        spdlog::debug("[OperationLog] Cannot serialize entry {}: {}", entry.id, e.what());
    }
}

std::vector<LogEntry> OperationLog::query(const LogQuery& filter) const {
    std::string needle;
    if (filter.searchText && !filter.searchText->empty())
        needle = config::to_lower(*filter.searchText);

    std::lock_guard<std::mutex> lk(mu_);
    std::vector<LogEntry> out;
    for (const auto& e : entries_) {
        if (filter.serverName && !filter.serverName->empty() && e.serverName != *filter.serverName)
            continue;
        if (filter.kind && e.kind != *filter.kind)
            continue;
        if (!needle.empty()) {
            const bool hit = containsFolded(e.operationName, needle) ||
                             containsFolded(dumpLossy(e.parameters), needle) ||
                             (e.response && containsFolded(dumpLossy(*e.response), needle));
            if (!hit)
                continue;
        }
        out.push_back(e);
    }
    return out;
}

LogStats OperationLog::stats() const {
    std::lock_guard<std::mutex> lk(mu_);
    LogStats s;
    s.total = entries_.size();

    // Connected clients are derived by replaying the retained window, oldest first.
    std::unordered_set<std::string> connected;
    for (const auto& e : entries_) {
        if (e.response && !e.error)
            ++s.successCount;
        if (e.error)
            ++s.errorCount;
        ++s.byServer[e.serverName];
        ++s.byKind[toString(e.kind)];

        if (e.kind == LogEntryKind::ClientConnected) {
            if (auto id = clientIdOf(e); !id.empty())
                connected.insert(id);
        } else if (e.kind == LogEntryKind::ClientDisconnected) {
            if (auto id = clientIdOf(e); !id.empty())
                connected.erase(id);
        }
    }
    s.connectedClients = connected.size();
    return s;
}

OperationLog::SubscriptionId OperationLog::subscribe(Subscriber callback) {
    std::lock_guard<std::mutex> lk(subscribersMu_);
    const auto id = nextSubscription_++;
    subscribers_.emplace(id, std::move(callback));
    return id;
}

void OperationLog::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lk(subscribersMu_);
    subscribers_.erase(id);
}

void OperationLog::setPersistPath(std::filesystem::path path) {
    std::error_code ec;
    if (path.has_parent_path())
        std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        spdlog::warn("[OperationLog] Cannot create log directory {}: {}",
                     path.parent_path().string(), ec.message());
    }
    std::lock_guard<std::mutex> lk(mu_);
    persistPath_ = std::move(path);
}

std::optional<std::filesystem::path> OperationLog::persistPath() const {
    std::lock_guard<std::mutex> lk(mu_);
    return persistPath_;
}

Result<std::size_t> OperationLog::loadPersisted(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::FileNotFound, "Cannot open " + path.string()};
    }

    std::vector<LogEntry> loaded;
    std::size_t skipped = 0;
    std::string line;
    while (std::getline(in, line)) {
        config::trim(line);
        if (line.empty())
            continue;
        auto doc = json::parse(line, nullptr, /*allow_exceptions=*/false);
        if (doc.is_discarded()) {
            ++skipped;
            continue;
        }
        auto parsed = LogEntry::fromJson(doc);
        if (!parsed) {
            ++skipped;
            continue;
        }
        loaded.push_back(std::move(parsed).value());
    }

    std::lock_guard<std::mutex> lk(mu_);
    for (auto& e : loaded)
        pushLocked(std::move(e));
    if (skipped > 0) {
        spdlog::warn("[OperationLog] Skipped {} malformed line(s) in {}", skipped, path.string());
    }
    return skipped;
}

void OperationLog::clear() {
    std::lock_guard<std::mutex> lk(mu_);
    entries_.clear();
}

void OperationLog::setCapacity(std::size_t capacity) {
    std::lock_guard<std::mutex> lk(mu_);
    capacity_ = std::max<std::size_t>(capacity, 1);
    while (entries_.size() > capacity_)
        entries_.pop_front();
}

std::size_t OperationLog::capacity() const {
    std::lock_guard<std::mutex> lk(mu_);
    return capacity_;
}

std::size_t OperationLog::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return entries_.size();
}

} // namespace mcplex::proxy
