#include <iostream>
#include <vector>
#include <string>
#include "cli/gestat_cli.hpp"
#include "cli/theme.hpp"

void print_usage() {
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    gestat jobs "
              << theme::color::RESET << theme::color::BROWN << "[file]"
              << theme::color::RESET << theme::color::DIM
              << "          List running and pending jobs" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    gestat queues "
              << theme::color::RESET << theme::color::BROWN << "[file]"
              << theme::color::RESET << theme::color::DIM
              << "        Per-queue load, memory and swap" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    gestat expand "
              << theme::color::RESET << theme::color::BROWN << "<job> [file]"
              << theme::color::RESET << theme::color::DIM
              << "  One row per array task of a job" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    gestat init"
              << theme::color::RESET << theme::color::DIM
              << "                 Write ~/.gestat/config.yaml" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    [file] is a `qstat -u '*' -f -xml -F` snapshot; '-' reads stdin\n"
              << "    --owner USER  --state CODE  --expand  --yaml  --sort number|priority|submitted\n\n"
              << "    gestat --version        Show version\n"
              << "    gestat --help           Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        if (argc == 1) {
            print_usage();
            return 1;
        }

        std::string cmd = argv[1];
        std::vector<std::string> args(argv + 2, argv + argc);

        if (cmd == "--version") {
            std::cout << theme::color::BROWN << theme::color::BOLD << "gestat"
                      << theme::color::RESET << theme::color::DIM
                      << " version 0.1.0" << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help") {
            print_usage();
            return 0;
        }

        GestatCLI cli;
        if (cmd == "jobs") {
            return cli.run_jobs(args);
        } else if (cmd == "queues") {
            return cli.run_queues(args);
        } else if (cmd == "expand") {
            return cli.run_expand(args);
        } else if (cmd == "init") {
            return cli.run_init();
        }

        std::cout << theme::fail("Unknown command: " + cmd);
        print_usage();
        return 1;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
