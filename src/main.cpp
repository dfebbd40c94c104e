#include <iostream>
#include <vector>
#include <string>
#include "cli/cp_cli.hpp"
#include "cli/theme.hpp"
#include "core/config.hpp"
#include "core/constants.hpp"

void print_usage(const CpCLI& cli) {
    std::cout << theme::banner(SSHCP_VERSION);
    std::cout << theme::section("Usage");
    std::cout << theme::color::TEAL << "    sshcp "
              << theme::color::RESET << theme::color::AMBER << "<target> <command> [args]"
              << theme::color::RESET << "\n";
    std::cout << theme::color::TEAL << "    sshcp init"
              << theme::color::RESET << theme::color::DIM
              << "            Write ~/.sshcp/config.yaml" << theme::color::RESET << "\n";
    cli.print_help();
    std::cout << theme::color::DIM
              << "    sshcp --version       Show version\n"
              << "    sshcp --help          Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        CpCLI cli;

        if (argc < 2) {
            print_usage(cli);
            return 1;
        }

        std::string first = argv[1];
        if (first == "--version") {
            std::cout << theme::color::TEAL << theme::color::BOLD << "sshcp"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << SSHCP_VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (first == "--help") {
            print_usage(cli);
            return 0;
        } else if (first == "init") {
            auto r = create_default_global_config();
            if (r.is_err()) {
                std::cout << theme::fail(r.error);
                return 1;
            }
            std::cout << theme::ok("Config at " + get_global_config_path().string());
            return 0;
        }

        if (argc < 3) {
            std::cout << theme::fail("Missing command for target " + first);
            print_usage(cli);
            return 1;
        }

        std::vector<std::string> args(argv + 3, argv + argc);
        return cli.run(first, argv[2], args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
