#include "cli.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        lsbridge::startup_config cfg{};
        if (auto cli_result = lsbridge::cli::parse_cli(argc, argv, cfg)) {
            return *cli_result;
        }

        if (cfg.mode == lsbridge::run_mode::repl) {
            lsbridge::cli::run_repl(cfg);
            return 0;
        }
        return lsbridge::mcp::run_mcp_server(cfg);
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    } catch (...) {
        std::cerr << "fatal: unknown exception\n";
        return 1;
    }
}
