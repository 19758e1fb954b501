#include <mcplex/cli/mcplex_cli.h>

#include <iostream>

int main(int argc, char* argv[]) {
    try {
        mcplex::cli::McplexCLI cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
