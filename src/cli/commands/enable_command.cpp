#include <mcplex/cli/command.h>
#include <mcplex/cli/mcplex_cli.h>
#include <mcplex/config/config_helpers.h>

#include <fmt/format.h>

#include <ostream>

namespace mcplex::cli {

using discovery::CapabilityKind;

namespace {

std::string normalizeSource(const std::string& source) {
    return config::expand_tilde(source).string();
}

} // namespace

// enable/disable a whole server by its composite key.
class ServerToggleCommand : public ICommand {
public:
    explicit ServerToggleCommand(bool enable) : enable_(enable) {}

    std::string getName() const override { return enable_ ? "enable" : "disable"; }

    std::string getDescription() const override {
        return enable_ ? "Forward a server through the proxy"
                       : "Stop forwarding a server (capability choices are kept)";
    }

    void registerCommand(CLI::App& app, McplexCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("source", source_, "Configuration file declaring the server")->required();
        cmd->add_option("server", server_, "Server name as declared in the source")->required();
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto& store = cli_->enablementStore();
        const auto source = normalizeSource(source_);
        if (enable_)
            store.enableAllForServer(source, server_);
        else
            store.disableServer(source, server_);

        auto saved = store.save();
        if (!saved)
            return saved;

        auto& out = cli_->out();
        out << fmt::format("{} {}\n", enable_ ? "Enabled" : "Disabled",
                           discovery::makeServerKey(source, server_));
        if (enable_)
            out << "Capabilities stay disabled until allowed with 'mcplex allow'\n";
        return {};
    }

private:
    McplexCLI* cli_ = nullptr;
    bool enable_;
    std::string source_;
    std::string server_;
};

// allow/deny a single tool, resource or prompt.
class CapabilityToggleCommand : public ICommand {
public:
    explicit CapabilityToggleCommand(bool allow) : allow_(allow) {}

    std::string getName() const override { return allow_ ? "allow" : "deny"; }

    std::string getDescription() const override {
        return allow_ ? "Forward one tool, resource or prompt of a server"
                      : "Stop forwarding one tool, resource or prompt of a server";
    }

    void registerCommand(CLI::App& app, McplexCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("source", source_, "Configuration file declaring the server")->required();
        cmd->add_option("server", server_, "Server name as declared in the source")->required();

        auto* which = cmd->add_option_group("capability");
        which->add_option("--tool", tool_, "Tool name");
        which->add_option("--resource", resource_, "Resource URI");
        which->add_option("--prompt", prompt_, "Prompt name");
        which->require_option(1);

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        CapabilityKind kind = CapabilityKind::Tool;
        std::string id = tool_;
        if (!resource_.empty()) {
            kind = CapabilityKind::Resource;
            id = resource_;
        } else if (!prompt_.empty()) {
            kind = CapabilityKind::Prompt;
            id = prompt_;
        }
        if (id.empty())
            return Error{ErrorCode::InvalidArgument, "Capability identifier must not be empty"};

        auto& store = cli_->enablementStore();
        const auto source = normalizeSource(source_);
        store.setCapabilityEnabled(kind, source, server_, id, allow_);

        auto saved = store.save();
        if (!saved)
            return saved;

        cli_->out() << fmt::format("{} {} '{}' on {}\n", allow_ ? "Allowed" : "Denied",
                                   discovery::toString(kind), id,
                                   discovery::makeServerKey(source, server_));
        if (allow_ && !store.isServerEnabled(source, server_))
            cli_->out() << "Note: the server itself is disabled\n";
        return {};
    }

private:
    McplexCLI* cli_ = nullptr;
    bool allow_;
    std::string source_;
    std::string server_;
    std::string tool_;
    std::string resource_;
    std::string prompt_;
};

namespace CommandRegistry {

std::unique_ptr<ICommand> createEnableCommand() {
    return std::make_unique<ServerToggleCommand>(true);
}

std::unique_ptr<ICommand> createDisableCommand() {
    return std::make_unique<ServerToggleCommand>(false);
}

std::unique_ptr<ICommand> createAllowCommand() {
    return std::make_unique<CapabilityToggleCommand>(true);
}

std::unique_ptr<ICommand> createDenyCommand() {
    return std::make_unique<CapabilityToggleCommand>(false);
}

} // namespace CommandRegistry

} // namespace mcplex::cli
