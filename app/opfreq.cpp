#include "cli.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        opfreq::run_config cfg{};
        if (auto cli_result = opfreq::cli::parse_cli(argc, argv, cfg)) {
            return *cli_result;
        }

        return opfreq::cli::run(cfg, std::cout, std::cerr);
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    }
}
