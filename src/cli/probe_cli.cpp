#include "probe_cli.hpp"
#include "theme.hpp"
#include <core/clock.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fingerprint/fingerprinter.hpp>
#include <fingerprint/profile_store.hpp>
#include <fingerprint/report.hpp>
#include <platform/terminal.hpp>
#include <ssh/libssh2_transport.hpp>
#include <ssh/shell_session.hpp>
#include <fmt/format.h>
#include <iostream>
#include <sstream>

static constexpr int PASSWORD_PROMPT_TIMEOUT_MS = 60000;

std::pair<std::string, int> split_host_port(const std::string& endpoint, int default_port) {
    auto colon = endpoint.rfind(':');
    // More than one colon is an IPv6 literal without a port
    if (colon == std::string::npos || endpoint.find(':') != colon) {
        return {endpoint, default_port};
    }
    int port = safe_stoi(endpoint.substr(colon + 1), 0);
    if (port <= 0 || port > 65535) port = default_port;
    return {endpoint.substr(0, colon), port};
}

std::vector<std::string> split_commands(const std::string& list) {
    std::vector<std::string> out;
    std::istringstream iss(list);
    std::string item;
    while (std::getline(iss, item, ',')) {
        trim(item);
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

Result<CliOptions> parse_args(const std::vector<std::string>& args, const char* password_env) {
    CliOptions opts;
    std::string host_arg;

    auto value_for = [&](size_t& i, const std::string& flag) -> Result<std::string> {
        if (i + 1 >= args.size()) {
            return Result<std::string>::Err("Missing value for " + flag);
        }
        return Result<std::string>::Ok(args[++i]);
    };

    auto number_for = [&](size_t& i, const std::string& flag, int min) -> Result<int> {
        auto v = value_for(i, flag);
        if (v.is_err()) return Result<int>::Err(v.error);
        int n = safe_stoi(v.value, min - 1);
        if (n < min) {
            return Result<int>::Err(fmt::format("Invalid value for {}: {}", flag, v.value));
        }
        return Result<int>::Ok(n);
    };

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& a = args[i];

        if (a == "--help" || a == "-h") {
            opts.show_help = true;
        } else if (a == "--version") {
            opts.show_version = true;
        } else if (a == "-d" || a == "--debug") {
            opts.debug = true;
        } else if (a == "-v" || a == "--verbose") {
            opts.verbose = true;
        } else if (a == "--save-profile") {
            opts.save_profile = true;
        } else if (a == "--profiles") {
            opts.list_profiles = true;
        } else if (a == "--prompt-count") {
            auto n = number_for(i, a, 1);
            if (n.is_err()) return Result<CliOptions>::Err(n.error);
            opts.prompt_count = n.value;
        } else if (a == "-i" || a == "--inter-command-time") {
            auto n = number_for(i, a, 0);
            if (n.is_err()) return Result<CliOptions>::Err(n.error);
            opts.inter_command_secs = n.value;
        } else if (a == "-u" || a == "--user" || a == "-p" || a == "--password" ||
                   a == "-o" || a == "--output" || a == "-s" || a == "--save" ||
                   a == "--cmd" || a == "--prompt" || a == "--profile" || a == "--forget" ||
                   a == "--config" || a == "--log-file") {
            auto v = value_for(i, a);
            if (v.is_err()) return Result<CliOptions>::Err(v.error);

            if (a == "-u" || a == "--user") opts.target.user = v.value;
            else if (a == "-p" || a == "--password") opts.target.password = v.value;
            else if (a == "-o" || a == "--output") opts.output_path = v.value;
            else if (a == "-s" || a == "--save") opts.save_path = v.value;
            else if (a == "--cmd") {
                for (auto& c : split_commands(v.value)) opts.extra_commands.push_back(c);
            }
            else if (a == "--prompt") opts.expected_prompt = v.value;
            else if (a == "--profile") opts.show_profile = v.value;
            else if (a == "--forget") opts.forget_profile = v.value;
            else if (a == "--config") opts.config_path = v.value;
            else opts.log_file = v.value;
        } else if (!a.empty() && a[0] == '-') {
            return Result<CliOptions>::Err("Unknown option: " + a);
        } else if (host_arg.empty()) {
            host_arg = a;
        } else {
            return Result<CliOptions>::Err("Unexpected argument: " + a);
        }
    }

    if (opts.show_help || opts.show_version || opts.list_profiles ||
        opts.show_profile || opts.forget_profile) {
        return Result<CliOptions>::Ok(opts);
    }

    if (host_arg.empty()) {
        return Result<CliOptions>::Err("Missing host");
    }
    auto [host, port] = split_host_port(host_arg, DEFAULT_SSH_PORT);
    opts.target.host = host;
    opts.target.port = port;

    if (opts.target.user.empty()) {
        return Result<CliOptions>::Err("Missing username (-u)");
    }
    if (opts.target.password.empty() && password_env) {
        opts.target.password = password_env;
    }
    return Result<CliOptions>::Ok(opts);
}

bool ProbeCLI::load_config(const CliOptions& options) {
    std::optional<fs::path> path;
    if (options.config_path) path = fs::path(*options.config_path);

    auto loaded = Config::load(path);
    if (loaded.is_err()) {
        std::cout << theme::fail(loaded.error);
        return false;
    }
    config_ = loaded.value;

    if (options.log_file) config_->set_log_file(*options.log_file);
    if (options.expected_prompt || options.prompt_count) {
        config_->set_expected_prompt(
            options.expected_prompt.value_or(config_->prompt().expected_prompt),
            options.prompt_count.value_or(config_->prompt().expected_prompt_count));
    }
    if (options.inter_command_secs) {
        config_->set_inter_command_delay(*options.inter_command_secs * 1000);
    }
    if (config_->log_file()) set_probe_log_path(*config_->log_file());
    set_probe_log_echo(options.debug);
    return true;
}

int ProbeCLI::run(CliOptions options) {
    if (!load_config(options)) return 1;

    if (options.target.password.empty() && platform::stdin_is_tty()) {
        options.target.password = platform::read_secret(
            fmt::format("  Password for {}@{}: ", options.target.user, options.target.host),
            PASSWORD_PROMPT_TIMEOUT_MS);
    }

    std::cout << theme::section(fmt::format("Probing {}:{}", options.target.host, options.target.port));
    probe_log(fmt::format("cli: probing {}:{} as {}", options.target.host,
                          options.target.port, options.target.user));

    ShellSession session(std::make_unique<Libssh2Transport>(), system_clock());
    if (options.verbose) {
        session.buffer().add_sink([](const std::string& chunk) {
            std::cout << theme::color::DIM << chunk << theme::color::RESET;
            std::cout.flush();
        });
    }

    Fingerprinter fingerprinter(session, config_->probe());
    DeviceRecord record = fingerprinter.run(options.target, options.extra_commands,
        [](const std::string& msg) { std::cout << theme::log(msg); });

    std::cout << theme::section("Result");
    if (record.success) {
        std::cout << theme::ok(fmt::format("Identified as {}", to_string(record.type)));
    } else {
        std::cout << theme::fail(record.error.empty()
            ? std::string("Could not identify device") : record.error);
    }

    std::cout << "\n";
    std::istringstream summary(record.summary());
    std::string line;
    while (std::getline(summary, line)) {
        std::cout << "  " << line << "\n";
    }

    if (!record.interfaces.empty()) {
        std::cout << theme::section("Interfaces");
        std::cout << record.interface_summary();
    }
    std::cout << "\n";

    if (options.output_path) {
        auto written = write_report(record, *options.output_path);
        if (written.is_err()) {
            std::cout << theme::fail(written.error);
        } else {
            std::cout << theme::ok("Report written to " + *options.output_path);
        }
    }

    if (options.save_path) {
        auto written = write_command_output(record, options.extra_commands, *options.save_path);
        if (written.is_err()) {
            std::cout << theme::fail(written.error);
        } else {
            std::cout << theme::ok("Command output saved to " + *options.save_path);
        }
    }

    if (options.save_profile && record.success) {
        ProfileStore store;
        store.load();
        store.add_or_update(profile_from_record(record));
        auto saved = store.save();
        if (saved.is_err()) {
            std::cout << theme::fail(saved.error);
        } else {
            std::cout << theme::ok("Profile saved to " + store.path().string());
        }
    }

    std::cout << theme::log("Debug log: " + probe_log_path());
    return record.success ? 0 : 1;
}

static void print_profile(const DeviceProfileEntry& e) {
    std::cout << theme::step(fmt::format("{}:{}", e.host, e.port));
    std::cout << theme::kv("Type", to_string(e.type));
    if (!e.hostname.empty()) std::cout << theme::kv("Hostname", e.hostname);
    if (!e.model.empty()) std::cout << theme::kv("Model", e.model);
    if (!e.version.empty()) std::cout << theme::kv("Version", e.version);
    if (!e.serial_number.empty()) std::cout << theme::kv("Serial", e.serial_number);
    if (!e.prompt.empty()) std::cout << theme::kv("Prompt", e.prompt);
    if (!e.paging_command.empty()) std::cout << theme::kv("Paging", e.paging_command);
    std::cout << theme::kv("Last seen", e.last_fingerprinted);
}

int ProbeCLI::show_profile(const ProfileStore& store, const std::string& endpoint) {
    auto [host, port] = split_host_port(endpoint, DEFAULT_SSH_PORT);
    auto entry = store.find(host, port);
    if (!entry) {
        std::cout << theme::fail(fmt::format("No saved profile for {}:{}", host, port));
        return 1;
    }
    std::cout << theme::section("Saved device profile");
    print_profile(*entry);
    std::cout << "\n";
    return 0;
}

int ProbeCLI::forget_profile(ProfileStore& store, const std::string& endpoint) {
    auto [host, port] = split_host_port(endpoint, DEFAULT_SSH_PORT);
    if (!store.remove(host, port)) {
        std::cout << theme::fail(fmt::format("No saved profile for {}:{}", host, port));
        return 1;
    }
    auto saved = store.save();
    if (saved.is_err()) {
        std::cout << theme::fail(saved.error);
        return 1;
    }
    std::cout << theme::ok(fmt::format("Forgot {}:{}", host, port));
    return 0;
}

int ProbeCLI::run_profiles(const CliOptions& options) {
    ProfileStore store;
    store.load();

    if (options.show_profile) return show_profile(store, *options.show_profile);
    if (options.forget_profile) return forget_profile(store, *options.forget_profile);

    std::cout << theme::section("Saved device profiles");
    if (store.all().empty()) {
        std::cout << theme::info("No profiles in " + store.path().string());
        return 0;
    }

    for (const auto& e : store.all()) {
        print_profile(e);
    }
    std::cout << "\n";
    return 0;
}
