#pragma once

#include <mcplex/core/types.h>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcplex::proxy {

using json = nlohmann::json;

enum class LogEntryKind {
    ToolCall,
    ResourceRead,
    PromptGet,
    ServerStarted,
    ServerStopped,
    ServerError,
    ClientConnected,
    ClientDisconnected
};

const char* toString(LogEntryKind kind) noexcept;
std::optional<LogEntryKind> parseLogEntryKind(std::string_view value) noexcept;

struct LogEntry {
    std::string id;
    TimePoint timestamp{};
    LogEntryKind kind{LogEntryKind::ToolCall};
    std::string serverName;
    std::string operationName;
    json parameters = json::object();
    std::optional<json> response;
    std::optional<std::string> error;
    std::optional<double> durationMs;
    // Elicitation rounds that happened while the operation was in flight.
    json elicitations = json::array();

    // "ERROR", "SUCCESS" or "PENDING".
    const char* status() const noexcept;

    json toJson() const;
    static Result<LogEntry> fromJson(const json& j);
};

struct LogStats {
    std::size_t total{0};
    std::size_t successCount{0};
    std::size_t errorCount{0};
    std::map<std::string, std::size_t> byServer;
    std::map<std::string, std::size_t> byKind;
    std::size_t connectedClients{0};
};

struct LogQuery {
    std::optional<std::string> serverName;
    std::optional<LogEntryKind> kind;
    std::optional<std::string> searchText;
};

/**
 * Bounded, append-only record of proxied operations and lifecycle events.
 *
 * Appends are serialized under one mutex: the entry is in the buffer (and visible to
 * query()) before the persisted copy is written and before subscribers are notified.
 * Subscribers run synchronously on the recording thread, after the lock is released;
 * a subscriber that throws is logged and skipped.
 */
class OperationLog {
public:
    using Subscriber = std::function<void(const LogEntry&)>;
    using SubscriptionId = std::uint64_t;

    explicit OperationLog(std::size_t capacity = 1000);

    LogEntry recordToolCall(std::string serverName, std::string toolName, json parameters,
                            std::optional<json> response = std::nullopt,
                            std::optional<std::string> error = std::nullopt,
                            std::optional<double> durationMs = std::nullopt,
                            json elicitations = json::array());
    LogEntry recordResourceRead(std::string serverName, std::string uri,
                                std::optional<json> response = std::nullopt,
                                std::optional<std::string> error = std::nullopt,
                                std::optional<double> durationMs = std::nullopt);
    LogEntry recordPromptGet(std::string serverName, std::string promptName, json parameters,
                             std::optional<json> response = std::nullopt,
                             std::optional<std::string> error = std::nullopt,
                             std::optional<double> durationMs = std::nullopt);
    LogEntry recordServerStarted(int port, std::size_t enabledServers,
                                 std::optional<std::string> message = std::nullopt);
    LogEntry recordServerStopped(std::optional<std::string> message = std::nullopt);
    LogEntry recordServerError(std::string error, json details = json::object());
    LogEntry recordClientConnected(const std::string& clientId,
                                   std::optional<std::string> remoteAddr = std::nullopt);
    LogEntry recordClientDisconnected(const std::string& clientId,
                                      std::optional<std::string> reason = std::nullopt);

    // Conjunctive filter; searchText matches operation name, parameters or response,
    // case-insensitively.
    std::vector<LogEntry> query(const LogQuery& filter = {}) const;
    std::vector<LogEntry> entries() const { return query(); }

    LogStats stats() const;

    SubscriptionId subscribe(Subscriber callback);
    void unsubscribe(SubscriptionId id);

    // Appends every subsequent entry as one JSON line; best effort.
    void setPersistPath(std::filesystem::path path);
    std::optional<std::filesystem::path> persistPath() const;

    /**
     * Replays a JSONL file written by the persistence sink into the buffer (oldest first,
     * bounded by capacity). Malformed lines are skipped; the count of skipped lines is
     * returned. Subscribers are not notified.
     */
    Result<std::size_t> loadPersisted(const std::filesystem::path& path);

    void clear();
    void setCapacity(std::size_t capacity);
    std::size_t capacity() const;
    std::size_t size() const;

private:
    LogEntry append(LogEntry entry);
    void persistLocked(const LogEntry& entry);
    void pushLocked(LogEntry entry);

    mutable std::mutex mu_;
    std::deque<LogEntry> entries_;
    std::size_t capacity_;
    std::uint64_t sequence_{0};
    std::optional<std::filesystem::path> persistPath_;

    mutable std::mutex subscribersMu_;
    std::map<SubscriptionId, Subscriber> subscribers_;
    SubscriptionId nextSubscription_{1};
};

} // namespace mcplex::proxy
