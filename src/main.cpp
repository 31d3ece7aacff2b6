#include <iostream>
#include <vector>
#include <string>
#include "cli/twin_cli.hpp"
#include "cli/theme.hpp"
#include <core/log.hpp>

int main(int argc, char** argv) {
    RuntimeOptions options;
    std::optional<fs::path> config_path;
    std::string command;
    std::vector<std::string> args;

    // Global flags may appear anywhere; everything else belongs to the command.
    for (int i = 1; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--verbose" || a == "-v") {
            options.verbose = true;
        } else if (a == "--dry-run") {
            options.dry_run = true;
        } else if (a == "--config" || a.rfind("--config=", 0) == 0) {
            if (a == "--config") {
                if (i + 1 >= argc) {
                    std::cerr << theme::fail("--config needs a file");
                    return 2;
                }
                config_path = fs::path(argv[++i]);
            } else {
                config_path = fs::path(a.substr(9));
            }
        } else if (command.empty() && (a == "--version" || a == "-V")) {
            std::cout << theme::color::TEAL << theme::color::BOLD << "twin"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << TWIN_VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (command.empty() && (a == "--help" || a == "-h")) {
            command = "help";
        } else if (command.empty()) {
            command = a;
        } else {
            args.push_back(a);
        }
    }

    init_logging(options, [](const std::string& msg) {
        std::cerr << theme::log(msg);
    });

    try {
        TwinCLI cli(options, config_path);

        if (command.empty()) {
            cli.print_usage();
            return 2;
        }
        return cli.run_command(command, args);
    } catch (const std::exception& e) {
        std::cerr << theme::fail(std::string(e.what()));
        return 1;
    }
}
