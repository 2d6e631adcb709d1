#pragma once

#include <optional>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/types.hpp>
#include <fingerprint/profile_store.hpp>

struct CliOptions {
    ProbeTarget target;
    std::optional<std::string> output_path;
    std::optional<std::string> save_path;           // raw command output
    std::vector<std::string> extra_commands;
    std::optional<std::string> expected_prompt;
    std::optional<int> prompt_count;
    std::optional<int> inter_command_secs;
    std::optional<std::string> show_profile;        // host[:port]
    std::optional<std::string> forget_profile;      // host[:port]
    std::optional<std::string> config_path;
    std::optional<std::string> log_file;
    bool save_profile = false;
    bool list_profiles = false;
    bool debug = false;         // echo the debug log to stderr
    bool verbose = false;       // echo device output as it arrives
    bool show_help = false;
    bool show_version = false;
};

// Parse argv (without the program name). The password falls back to
// password_env when -p is absent.
Result<CliOptions> parse_args(const std::vector<std::string>& args,
                              const char* password_env = nullptr);

// "host", "host:2222" -> host and port. Bad or missing port -> default_port.
std::pair<std::string, int> split_host_port(const std::string& endpoint, int default_port);

// "a, b,c" -> {"a", "b", "c"}; empty items dropped.
std::vector<std::string> split_commands(const std::string& list);

class ProbeCLI {
public:
    // Returns the process exit status.
    int run(CliOptions options);
    // --profiles, --profile and --forget
    int run_profiles(const CliOptions& options);

private:
    std::optional<Config> config_;

    bool load_config(const CliOptions& options);
    int show_profile(const ProfileStore& store, const std::string& endpoint);
    int forget_profile(ProfileStore& store, const std::string& endpoint);
};
