#include "cqlens/cli.hpp"
#include "cqlens/mcp.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        cqlens::startup_config cfg{};
        if (auto cli_result = cqlens::cli::parse_cli(argc, argv, cfg)) {
            return *cli_result;
        }

        if (cfg.mcp) {
            return cqlens::mcp::run_mcp_server(cfg);
        }
        if (!cfg.eval_commands.empty()) {
            return cqlens::cli::run_eval(cfg);
        }

        cqlens::cli::run_repl(cfg);
        return 0;
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    } catch (...) {
        std::cerr << "fatal: unknown exception\n";
        return 1;
    }
}
