#include <iostream>
#include <string>
#include "cli/hostshell_cli.hpp"
#include "cli/theme.hpp"
#include <core/config.hpp>

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    hostshell"
              << theme::color::RESET << theme::color::DIM
              << "                  Start a local shell session" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    hostshell local"
              << theme::color::RESET << theme::color::DIM
              << "            Start a local shell session" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    hostshell remote"
              << theme::color::RESET << theme::color::DIM
              << "           Start a shell session on the configured host" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    hostshell exec "
              << theme::color::RESET << theme::color::BROWN << "<command...>"
              << theme::color::RESET << theme::color::DIM
              << " Run one command and exit with its status" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    hostshell --version        Show version\n"
              << "    hostshell --help           Show this help\n\n"
              << "    Configuration: ~/.hostshell/config.yaml, ./hostshell.yaml"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        std::string cmd = argc >= 2 ? argv[1] : "local";

        if (cmd == "--version") {
            std::cout << theme::color::BROWN << theme::color::BOLD << "hostshell"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << HOSTSHELL_VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help") {
            print_usage();
            return 0;
        }

        auto config = Config::load();
        if (config.is_err()) {
            std::cout << theme::fail(config.error);
            return 1;
        }
        HostshellCLI cli(config.value);

        if (cmd == "local") {
            return cli.run_local_repl();
        } else if (cmd == "remote") {
            return cli.run_remote_repl();
        } else if (cmd == "exec") {
            if (argc < 3) {
                std::cout << theme::fail("Missing command.");
                std::cout << theme::step("Usage: hostshell exec <command...>");
                return 1;
            }
            std::string command = argv[2];
            for (int i = 3; i < argc; i++) {
                command += " ";
                command += argv[i];
            }
            return cli.run_exec(command);
        } else {
            std::cout << theme::fail("Unknown command: " + cmd);
            print_usage();
            return 1;
        }
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
