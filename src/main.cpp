#include <atomic>
#include <csignal>
#include <iostream>
#include <string>
#include <vector>
#include "cli/portscope_cli.hpp"
#include "cli/theme.hpp"
#include "core/constants.hpp"

static std::atomic<bool>* g_cancel_flag = nullptr;

static void on_sigint(int) {
    if (g_cancel_flag) g_cancel_flag->store(true);
}

void print_usage() {
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    portscope "
              << theme::color::RESET << theme::color::TEAL << "[deploy_path]"
              << theme::color::RESET << theme::color::DIM
              << "           Discover exposed ports on the configured host" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    portscope parse "
              << theme::color::RESET << theme::color::TEAL << "<kind> <file>"
              << theme::color::RESET << theme::color::DIM
              << "     Parse captured output (json, table, compose, listeners)" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    --config <file>       Config file (default ~/.portscope/config.yaml)\n"
              << "    --host <host>         Override remote host\n"
              << "    --user <user>         Override remote user\n"
              << "    --port <port>         Override SSH port\n"
              << "    --verbose, -v         Echo remote commands and timings\n"
              << "    --version             Show version\n"
              << "    --help                Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);
        PortscopeCLI cli;

        if (!args.empty()) {
            const std::string& cmd = args[0];

            if (cmd == "--version") {
                std::cout << theme::color::TEAL << theme::color::BOLD << "portscope"
                          << theme::color::RESET << theme::color::DIM
                          << " version " << PORTSCOPE_VERSION << theme::color::RESET << "\n";
                return 0;
            }
            if (cmd == "--help" || cmd == "-h") {
                print_usage();
                return 0;
            }
            if (cmd == "parse") {
                if (args.size() < 3) {
                    std::cout << theme::fail("Missing arguments.");
                    std::cout << theme::step("Usage: portscope parse <kind> <file> [--host H]");
                    return 1;
                }
                std::string host = DEFAULT_HOST;
                if (args.size() >= 5 && args[3] == "--host") host = args[4];
                return cli.run_parse(args[1], args[2], host);
            }
        }

        auto options = parse_cli_options(args);
        if (options.is_err()) {
            std::cout << theme::fail(options.error);
            print_usage();
            return 1;
        }

        g_cancel_flag = cli.cancel_token().raw_flag();
        std::signal(SIGINT, on_sigint);

        return cli.run_discover(options.value);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
