#include <mcplex/cli/command.h>
#include <mcplex/cli/mcplex_cli.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fmt/format.h>

#include <ostream>

namespace mcplex::cli {

using discovery::ServerDescriptor;
using discovery::ServerStatus;

namespace {

std::string statusLabel(const ServerDescriptor& s) {
    switch (s.status) {
        case ServerStatus::Connected:
            return "connected";
        case ServerStatus::Error:
            return "error";
        case ServerStatus::Disconnected:
            break;
    }
    return "configured";
}

} // namespace

class DiscoverCommand : public ICommand {
public:
    std::string getName() const override { return "discover"; }

    std::string getDescription() const override {
        return "List MCP servers declared in configuration sources";
    }

    void registerCommand(CLI::App& app, McplexCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("discover", getDescription());
        cmd->add_flag("--flat", flat_,
                      "Single list with duplicate names renamed, plus other clients' servers");
        cmd->add_flag("--json", jsonOutput_, "Output in JSON format");
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto engine = cli_->makeDiscoveryEngine();
        auto& store = cli_->enablementStore();
        auto& out = cli_->out();

        auto isEnabled = [&store](const ServerDescriptor& s) {
            return store.isServerEnabled(s.sourcePath,
                                         s.originalName.empty() ? s.name : s.originalName);
        };

        if (flat_) {
            auto servers = engine->discoverFlat();
            if (jsonOutput_) {
                nlohmann::json arr = nlohmann::json::array();
                for (const auto& s : servers) {
                    auto j = s.toJson();
                    j["enabled"] = isEnabled(s);
                    arr.push_back(std::move(j));
                }
                out << arr.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
                return {};
            }
            for (const auto& s : servers)
                printServer(out, s, isEnabled(s));
            out << fmt::format("{} server(s)\n", servers.size());
            return {};
        }

        auto report = engine->discoverHierarchical();
        for (const auto& skipped : report.skipped) {
            spdlog::warn("[Discovery] Skipped {}: {}", skipped.path, skipped.reason.message);
        }

        if (jsonOutput_) {
            nlohmann::json j;
            j["sources"] = nlohmann::json::array();
            for (const auto& src : report.sources) {
                nlohmann::json servers = nlohmann::json::array();
                for (const auto& s : src.servers) {
                    auto sj = s.toJson();
                    sj["enabled"] = isEnabled(s);
                    servers.push_back(std::move(sj));
                }
                j["sources"].push_back({{"path", src.path}, {"servers", std::move(servers)}});
            }
            j["skipped"] = nlohmann::json::array();
            for (const auto& skipped : report.skipped) {
                j["skipped"].push_back(
                    {{"path", skipped.path}, {"reason", skipped.reason.message}});
            }
            out << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
            return {};
        }

        if (report.sources.empty()) {
            out << "No MCP configuration sources found\n";
            return {};
        }
        for (const auto& src : report.sources) {
            out << src.path << "\n";
            for (const auto& s : src.servers)
                printServer(out, s, isEnabled(s));
        }
        return {};
    }

private:
    static void printServer(std::ostream& out, const ServerDescriptor& s, bool enabled) {
        out << fmt::format("  {} {:<24} {:<10} {}\n", enabled ? "*" : " ", s.name,
                           statusLabel(s), s.capabilitiesSummary());
        if (s.errorMessage)
            out << fmt::format("      {}\n", *s.errorMessage);
    }

    McplexCLI* cli_ = nullptr;
    bool flat_ = false;
    bool jsonOutput_ = false;
};

namespace CommandRegistry {

std::unique_ptr<ICommand> createDiscoverCommand() {
    return std::make_unique<DiscoverCommand>();
}

} // namespace CommandRegistry

} // namespace mcplex::cli
