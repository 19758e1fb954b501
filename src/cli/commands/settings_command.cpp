#include <mcplex/cli/command.h>
#include <mcplex/cli/mcplex_cli.h>

#include <fmt/format.h>

#include <optional>
#include <ostream>

namespace mcplex::cli {

class SettingsCommand : public ICommand {
public:
    std::string getName() const override { return "settings"; }

    std::string getDescription() const override {
        return "Show or change global proxy settings";
    }

    void registerCommand(CLI::App& app, McplexCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("settings", getDescription());
        cmd->add_option("--port", port_, "Proxy listen port")->check(CLI::Range(1, 65535));
        cmd->add_option("--max-log-entries", maxLogEntries_, "Operation log capacity")
            ->check(CLI::PositiveNumber);
        cmd->add_option("--rate-limit", rateLimit_,
                        "Max forwarded requests per second (0 disables the limit)")
            ->check(CLI::NonNegativeNumber);
        cmd->add_option("--logging", logging_, "Record forwarded operations")
            ->check(CLI::IsMember({"on", "off"}));
        cmd->add_option("--proxy", proxy_, "Start the proxy with the session")
            ->check(CLI::IsMember({"on", "off"}));
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto& store = cli_->enablementStore();
        auto settings = store.settings();

        bool changed = false;
        if (port_) {
            settings.port = *port_;
            changed = true;
        }
        if (maxLogEntries_) {
            settings.maxLogEntries = *maxLogEntries_;
            changed = true;
        }
        if (rateLimit_) {
            if (*rateLimit_ > 0.0)
                settings.rateLimit = *rateLimit_;
            else
                settings.rateLimit.reset();
            changed = true;
        }
        if (logging_) {
            settings.loggingOn = (*logging_ == "on");
            changed = true;
        }
        if (proxy_) {
            settings.enabled = (*proxy_ == "on");
            changed = true;
        }

        if (changed) {
            store.updateSettings(settings);
            auto saved = store.save();
            if (!saved)
                return saved;
        }

        auto& out = cli_->out();
        out << fmt::format("proxy enabled    : {}\n", settings.enabled ? "yes" : "no");
        out << fmt::format("port             : {}\n", settings.port);
        out << fmt::format("logging          : {}\n", settings.loggingOn ? "on" : "off");
        out << fmt::format("max log entries  : {}\n", settings.maxLogEntries);
        out << fmt::format("rate limit       : {}\n",
                           settings.rateLimit ? fmt::format("{}/s", *settings.rateLimit)
                                              : std::string("unlimited"));
        return {};
    }

private:
    McplexCLI* cli_ = nullptr;
    std::optional<int> port_;
    std::optional<std::size_t> maxLogEntries_;
    std::optional<double> rateLimit_;
    std::optional<std::string> logging_;
    std::optional<std::string> proxy_;
};

namespace CommandRegistry {

std::unique_ptr<ICommand> createSettingsCommand() {
    return std::make_unique<SettingsCommand>();
}

} // namespace CommandRegistry

} // namespace mcplex::cli
