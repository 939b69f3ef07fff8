#include "cli.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        irdiverge::analysis_config cfg{};
        irdiverge::cli::run_options opts{};
        if (auto cli_result = irdiverge::cli::parse_cli(argc, argv, cfg, opts)) {
            return *cli_result;
        }

        return irdiverge::cli::run(cfg, opts);
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    } catch (...) {
        std::cerr << "fatal: unknown exception\n";
        return 1;
    }
}
