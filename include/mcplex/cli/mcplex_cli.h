#pragma once

#include <mcplex/cli/command.h>
#include <mcplex/discovery/discovery_engine.h>
#include <mcplex/proxy/enablement_store.h>

#include <CLI/CLI.hpp>

#include <filesystem>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace mcplex::cli {

class McplexCLI {
public:
    McplexCLI();
    ~McplexCLI();

    McplexCLI(const McplexCLI&) = delete;
    McplexCLI& operator=(const McplexCLI&) = delete;

    // Returns the process exit code.
    int run(int argc, char* argv[]);

    void registerCommand(std::unique_ptr<ICommand> command);
    void setPendingCommand(ICommand* cmd) { pendingCommand_ = cmd; }

    // Loaded on first use from --config-dir, else the default config location.
    proxy::EnablementStore& enablementStore();

    // --source values when given, else the well-known locations.
    std::vector<std::filesystem::path> sourcePaths() const;

    // Validate-only engine (no prober) over sourcePaths().
    std::unique_ptr<discovery::DiscoveryEngine> makeDiscoveryEngine() const;

    // Command output; stdout unless redirected.
    std::ostream& out() { return *out_; }
    void setOutput(std::ostream* out);

    // Leaves the process-wide logger alone; used when embedding the CLI.
    void setConfigureLogging(bool enabled) { configureLogging_ = enabled; }

private:
    void setupLogging();

    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;
    ICommand* pendingCommand_ = nullptr;

    std::string logLevel_{"warn"};
    std::string logFile_;
    std::string configDir_;
    std::vector<std::string> sources_;
    bool configureLogging_{true};

    std::unique_ptr<proxy::EnablementStore> store_;
    std::ostream* out_;
};

namespace CommandRegistry {

void registerAllCommands(McplexCLI* cli);

std::unique_ptr<ICommand> createDiscoverCommand();
std::unique_ptr<ICommand> createEnableCommand();
std::unique_ptr<ICommand> createDisableCommand();
std::unique_ptr<ICommand> createAllowCommand();
std::unique_ptr<ICommand> createDenyCommand();
std::unique_ptr<ICommand> createSettingsCommand();
std::unique_ptr<ICommand> createLogsCommand();

} // namespace CommandRegistry

} // namespace mcplex::cli
