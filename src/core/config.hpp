#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load ~/.devprobe/config.yaml; a missing file yields the defaults.
    static Result<Config> load_global();

    // Load a specific file; a missing file is an error.
    static Result<Config> load_file(const fs::path& path);

    // Explicit path if given, otherwise the global file.
    static Result<Config> load(const std::optional<fs::path>& path = std::nullopt);

    // Parse YAML text (used by the loaders and by tests).
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const ProbeConfig& probe() const { return probe_; }
    const TimingConfig& timing() const { return probe_.timing; }
    const RetryConfig& retry() const { return probe_.retry; }
    const PromptConfig& prompt() const { return probe_.prompt; }
    const ExtractionConfig& extraction() const { return probe_.extraction; }
    const std::optional<std::string>& log_file() const { return probe_.log_file; }

    void set_log_file(const std::string& path) { probe_.log_file = path; }
    void set_expected_prompt(const std::string& prompt, int count) {
        probe_.prompt.expected_prompt = prompt;
        probe_.prompt.expected_prompt_count = count;
    }
    void set_inter_command_delay(int ms) { probe_.timing.inter_command_delay_ms = ms; }

public:
    Config() = default;

private:
    ProbeConfig probe_;
};

bool global_config_exists();

// Get paths
fs::path get_devprobe_dir();
fs::path get_global_config_path();

// Create default global config
Result<void> create_default_config();
