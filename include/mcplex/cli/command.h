#pragma once

#include <mcplex/core/types.h>

#include <CLI/CLI.hpp>

#include <string>

namespace mcplex::cli {

class McplexCLI;

/**
 * Base interface for CLI commands
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    virtual std::string getName() const = 0;
    virtual std::string getDescription() const = 0;

    /**
     * Register this command with the CLI11 app. The subcommand callback should only mark
     * the command pending; McplexCLI runs it after parsing and logging setup.
     */
    virtual void registerCommand(CLI::App& app, McplexCLI* cli) = 0;

    virtual Result<void> execute() = 0;
};

} // namespace mcplex::cli
