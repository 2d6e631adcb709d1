#include <cstdlib>
#include <iostream>
#include <vector>
#include <string>
#include "cli/probe_cli.hpp"
#include "cli/theme.hpp"
#include "core/constants.hpp"

void print_usage() {
    std::cout << theme::banner(DEVPROBE_VERSION);
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    devprobe "
              << theme::color::RESET << theme::color::BROWN << "<host[:port]> -u <user>"
              << theme::color::RESET << theme::color::DIM
              << "   Identify a device" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    devprobe --profiles"
              << theme::color::RESET << theme::color::DIM
              << "                 List saved device profiles" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    devprobe --profile "
              << theme::color::RESET << theme::color::BROWN << "<host[:port]>"
              << theme::color::RESET << theme::color::DIM
              << "    Show one saved profile" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    devprobe --forget "
              << theme::color::RESET << theme::color::BROWN << "<host[:port]>"
              << theme::color::RESET << theme::color::DIM
              << "     Delete a saved profile" << theme::color::RESET << "\n";
    std::cout << theme::section("Options");
    std::cout << theme::color::DIM
              << "    -p, --password <pw>    Password (or set " << PASSWORD_ENV_VAR << ")\n"
              << "    -o, --output <file>    Write the device record as YAML\n"
              << "    --cmd \"c1,c2\"          Extra commands to run after identification\n"
              << "    -s, --save <file>      Save the raw command output\n"
              << "    --prompt <text>        Expected prompt; skips prompt detection\n"
              << "    --prompt-count <n>     Prompts to see before a command is done (default 1)\n"
              << "    -i, --inter-command-time <secs>  Pause between commands\n"
              << "    --config <file>        Config file (default ~/.devprobe/config.yaml)\n"
              << "    --log-file <file>      Debug log location\n"
              << "    --save-profile         Remember this device in ~/.devprobe/profiles.yaml\n"
              << "    -d, --debug            Echo the debug log to stderr\n"
              << "    -v, --verbose          Show device output as it arrives\n"
              << "    --version              Show version\n"
              << "    --help                 Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);
        if (args.empty()) {
            print_usage();
            return 1;
        }

        auto parsed = parse_args(args, std::getenv(PASSWORD_ENV_VAR));
        if (parsed.is_err()) {
            std::cout << theme::fail(parsed.error);
            print_usage();
            return 1;
        }
        const CliOptions& opts = parsed.value;

        if (opts.show_version) {
            std::cout << theme::color::BROWN << theme::color::BOLD << "devprobe"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << DEVPROBE_VERSION << theme::color::RESET << "\n";
            return 0;
        }
        if (opts.show_help) {
            print_usage();
            return 0;
        }

        ProbeCLI cli;
        if (opts.list_profiles || opts.show_profile || opts.forget_profile) {
            return cli.run_profiles(opts);
        }
        return cli.run(opts);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
