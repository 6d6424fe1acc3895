#include <iostream>
#include <vector>
#include <string>
#include "cli/cec_cli.hpp"
#include "cli/theme.hpp"
#include "core/constants.hpp"

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);
        CecSshCli cli(current_search_environment(), std::cout, std::cerr);
        return cli.run(args);
    } catch (const std::exception& e) {
        std::cerr << theme::fail(std::string(e.what()));
        return EXIT_INTERNAL;
    }
}
