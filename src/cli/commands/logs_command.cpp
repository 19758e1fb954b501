#include <mcplex/cli/command.h>
#include <mcplex/cli/mcplex_cli.h>
#include <mcplex/proxy/control_plane.h>
#include <mcplex/proxy/operation_log.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fmt/format.h>

#include <ctime>
#include <filesystem>
#include <limits>
#include <optional>
#include <ostream>

namespace mcplex::cli {

using proxy::LogEntry;
using proxy::OperationLog;

class LogsCommand : public ICommand {
public:
    std::string getName() const override { return "logs"; }

    std::string getDescription() const override {
        return "Query a persisted proxy operation log (.jsonl)";
    }

    void registerCommand(CLI::App& app, McplexCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("logs", getDescription());
        cmd->add_option("file", file_,
                        "Log file written by the proxy (default: newest in the data dir)")
            ->check(CLI::ExistingFile);
        cmd->add_option("--server", server_, "Only entries for this server");
        cmd->add_option("--kind", kind_, "Only entries of this kind (e.g. tool_call)");
        cmd->add_option("--search", search_, "Case-insensitive text search");
        cmd->add_option("-n,--limit", limit_, "Keep at most the last N entries")
            ->check(CLI::PositiveNumber);
        cmd->add_flag("--stats", stats_, "Show summary statistics instead of entries");
        cmd->add_flag("--json", jsonOutput_, "Output in JSON format");
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        proxy::LogQuery query;
        if (!server_.empty())
            query.serverName = server_;
        if (!search_.empty())
            query.searchText = search_;
        if (!kind_.empty()) {
            auto k = proxy::parseLogEntryKind(kind_);
            if (!k)
                return Error{ErrorCode::InvalidArgument, "Unknown entry kind: " + kind_};
            query.kind = *k;
        }

        std::filesystem::path file = file_;
        if (file.empty()) {
            auto newest = newestSessionLog(proxy::defaultLogDirectory());
            if (!newest)
                return newest.error();
            file = newest.value();
        }

        OperationLog log(limit_);
        auto loaded = log.loadPersisted(file);
        if (!loaded)
            return loaded.error();
        if (loaded.value() > 0)
            spdlog::warn("Skipped {} malformed line(s)", loaded.value());

        auto& out = cli_->out();
        if (stats_) {
            auto s = log.stats();
            if (jsonOutput_) {
                out << nlohmann::json{{"total", s.total},
                                      {"success", s.successCount},
                                      {"errors", s.errorCount},
                                      {"by_server", s.byServer},
                                      {"by_kind", s.byKind},
                                      {"connected_clients", s.connectedClients}}
                           .dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
                    << "\n";
                return {};
            }
            out << fmt::format("total: {}  success: {}  errors: {}  connected clients: {}\n",
                               s.total, s.successCount, s.errorCount, s.connectedClients);
            for (const auto& [server, n] : s.byServer)
                out << fmt::format("  server {:<24} {}\n", server, n);
            for (const auto& [kind, n] : s.byKind)
                out << fmt::format("  kind   {:<24} {}\n", kind, n);
            return {};
        }

        auto entries = log.query(query);
        if (jsonOutput_) {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& e : entries)
                arr.push_back(e.toJson());
            out << arr.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
            return {};
        }
        for (const auto& e : entries)
            out << formatLine(e) << "\n";
        return {};
    }

private:
    static Result<std::filesystem::path> newestSessionLog(const std::filesystem::path& dir) {
        std::error_code ec;
        std::filesystem::directory_iterator it(dir, ec);
        if (ec)
            return Error{ErrorCode::FileNotFound, "No session logs in " + dir.string()};

        std::optional<std::filesystem::path> newest;
        std::filesystem::file_time_type newestTime{};
        for (const auto& entry : it) {
            const auto name = entry.path().filename().string();
            if (!entry.is_regular_file(ec) || name.rfind("proxy-", 0) != 0 ||
                entry.path().extension() != ".jsonl")
                continue;
            auto t = entry.last_write_time(ec);
            if (ec)
                continue;
            if (!newest || t > newestTime) {
                newest = entry.path();
                newestTime = t;
            }
        }
        if (!newest)
            return Error{ErrorCode::FileNotFound, "No session logs in " + dir.string()};
        return *newest;
    }

    static std::string formatLine(const LogEntry& e) {
        const auto secs = std::chrono::system_clock::to_time_t(e.timestamp);
        std::tm local{};
        localtime_r(&secs, &local);
        char ts[16];
        std::strftime(ts, sizeof(ts), "%H:%M:%S", &local);

        std::string line = fmt::format("{} {:<7} {:<19} {:<16} {}", ts, e.status(),
                                       proxy::toString(e.kind), e.serverName, e.operationName);
        if (e.durationMs)
            line += fmt::format(" ({:.1f} ms)", *e.durationMs);
        if (e.error)
            line += " - " + *e.error;
        return line;
    }

    McplexCLI* cli_ = nullptr;
    std::string file_;
    std::string server_;
    std::string kind_;
    std::string search_;
    std::size_t limit_ = std::numeric_limits<std::size_t>::max();
    bool stats_ = false;
    bool jsonOutput_ = false;
};

namespace CommandRegistry {

std::unique_ptr<ICommand> createLogsCommand() {
    return std::make_unique<LogsCommand>();
}

} // namespace CommandRegistry

} // namespace mcplex::cli
