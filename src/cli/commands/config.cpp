#include "../base_cli.hpp"
#include "../args.hpp"
#include "../theme.hpp"
#include <core/config.hpp>
#include <iostream>
#include <fmt/format.h>

static int do_init(BaseCLI& cli, const std::vector<std::string>& args) {
    auto parsed = parse_args(args, ArgSpec{{"--force"}, {}, {{"-f", "--force"}}});
    if (!parsed.error.empty() || parsed.positional.size() > 1) {
        if (!parsed.error.empty()) std::cerr << theme::fail(parsed.error);
        std::cerr << theme::step("Usage: twin init [path] [--force]");
        return EXIT_USAGE;
    }

    fs::path dir = parsed.positional.empty() ? cli.cwd : fs::path(parsed.arg(0));
    if (dir.is_relative()) dir = cli.cwd / dir;

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        std::cerr << theme::fail("Not a directory: " + dir.string());
        return EXIT_FAILED;
    }

    auto written = create_example_project_config(dir, parsed.has("--force"));
    if (written.is_err()) {
        std::cerr << theme::fail(written.error);
        return EXIT_FAILED;
    }
    std::cout << theme::ok("Wrote " + written.value.string());
    std::cout << theme::step("Edit the files: and hooks: sections, then run 'twin add <path>'");
    return EXIT_OK;
}

static int do_config(BaseCLI& cli, const std::vector<std::string>& args) {
    auto parsed = parse_args(args, ArgSpec{{"--show"}, {}, {}});
    if (!parsed.error.empty() || !parsed.positional.empty()) {
        if (!parsed.error.empty()) std::cerr << theme::fail(parsed.error);
        std::cerr << theme::step("Usage: twin config [--show]");
        return EXIT_USAGE;
    }

    if (!cli.require_config()) return EXIT_FAILED;

    const auto& source = cli.config->source_path();
    std::cout << theme::dim("# project: " + (source.empty() ? std::string("(none, defaults)")
                                                             : source.string())) << "\n";
    std::cout << theme::dim("# global:  " + get_global_config_path().string()) << "\n";
    std::cout << cli.config->to_yaml() << "\n";
    return EXIT_OK;
}

void register_config_commands(BaseCLI& cli) {
    cli.add_command("init", do_init, "Write an example twin.yaml");
    cli.add_command("config", do_config, "Print the effective configuration");
}
