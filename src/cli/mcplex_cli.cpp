#include <mcplex/cli/mcplex_cli.h>
#include <mcplex/config/config_helpers.h>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>

namespace mcplex::cli {

McplexCLI::McplexCLI() : out_(&std::cout) {
    app_ = std::make_unique<CLI::App>("mcplex - MCP server discovery and proxy control");
    app_->require_subcommand(1);

    app_->add_option("-l,--log-level", logLevel_, "Log level (trace, debug, info, warn, error)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "off"}))
        ->default_val("warn");
    app_->add_option("--log-file", logFile_, "Diagnostic log file path (optional)");
    app_->add_option("--config-dir", configDir_,
                     "Directory holding proxy-config.json (default: $MCPLEX_CONFIG_DIR)");
    app_->add_option("-s,--source", sources_,
                     "MCP configuration file to read; repeatable (default: well-known locations)");

    CommandRegistry::registerAllCommands(this);
}

McplexCLI::~McplexCLI() = default;

void McplexCLI::registerCommand(std::unique_ptr<ICommand> command) {
    command->registerCommand(*app_, this);
    commands_.push_back(std::move(command));
}

void McplexCLI::setOutput(std::ostream* out) {
    out_ = out ? out : &std::cout;
}

void McplexCLI::setupLogging() {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!logFile_.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFile_, 10 * 1024 * 1024, 3));
    }
    auto logger = std::make_shared<spdlog::logger>("mcplex", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);

    if (logLevel_ == "trace")
        spdlog::set_level(spdlog::level::trace);
    else if (logLevel_ == "debug")
        spdlog::set_level(spdlog::level::debug);
    else if (logLevel_ == "info")
        spdlog::set_level(spdlog::level::info);
    else if (logLevel_ == "error")
        spdlog::set_level(spdlog::level::err);
    else if (logLevel_ == "off")
        spdlog::set_level(spdlog::level::off);
    else
        spdlog::set_level(spdlog::level::warn);

    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
}

int McplexCLI::run(int argc, char* argv[]) {
    try {
        app_->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    }

    if (configureLogging_) {
        try {
            setupLogging();
        } catch (const spdlog::spdlog_ex& e) {
            std::cerr << "Failed to setup logging: " << e.what() << std::endl;
            return 1;
        }
    }

    if (!pendingCommand_)
        return 0;

    try {
        auto result = pendingCommand_->execute();
        if (!result) {
            spdlog::error("{} failed: {}", pendingCommand_->getName(), result.error().message);
            return 1;
        }
    } catch (const std::exception& e) {
        spdlog::error("{} failed: {}", pendingCommand_->getName(), e.what());
        return 1;
    }
    return 0;
}

proxy::EnablementStore& McplexCLI::enablementStore() {
    if (!store_) {
        if (configDir_.empty()) {
            store_ = std::make_unique<proxy::EnablementStore>();
        } else {
            store_ = std::make_unique<proxy::EnablementStore>(config::expand_tilde(configDir_) /
                                                              "proxy-config.json");
        }
        store_->load();
        if (const auto& err = store_->lastLoadError()) {
            spdlog::warn("Using default proxy settings: {}", err->message);
        }
    }
    return *store_;
}

std::vector<std::filesystem::path> McplexCLI::sourcePaths() const {
    if (sources_.empty())
        return config::default_source_paths();
    std::vector<std::filesystem::path> out;
    out.reserve(sources_.size());
    for (const auto& s : sources_)
        out.push_back(config::expand_tilde(s));
    return out;
}

std::unique_ptr<discovery::DiscoveryEngine> McplexCLI::makeDiscoveryEngine() const {
    auto engine = std::make_unique<discovery::DiscoveryEngine>(
        discovery::SourceLoader(sourcePaths()), nullptr);
    if (sources_.empty()) {
        engine->addSupplementalSource(
            std::make_shared<discovery::ClientConfigSupplementalSource>(
                config::supplemental_source_paths()));
    }
    return engine;
}

namespace CommandRegistry {

void registerAllCommands(McplexCLI* cli) {
    cli->registerCommand(createDiscoverCommand());
    cli->registerCommand(createEnableCommand());
    cli->registerCommand(createDisableCommand());
    cli->registerCommand(createAllowCommand());
    cli->registerCommand(createDenyCommand());
    cli->registerCommand(createSettingsCommand());
    cli->registerCommand(createLogsCommand());
}

} // namespace CommandRegistry

} // namespace mcplex::cli
