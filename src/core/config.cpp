#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>

namespace fs = std::filesystem;

static TimingConfig parse_timing_config(const YAML::Node& node) {
    TimingConfig t;
    t.poll_interval_ms = node["poll_interval_ms"].as<int>(t.poll_interval_ms);
    t.quiescence_ms = node["quiescence_ms"].as<int>(t.quiescence_ms);
    t.min_wait_ms = node["min_wait_ms"].as<int>(t.min_wait_ms);
    t.command_timeout_ms = node["command_timeout_ms"].as<int>(t.command_timeout_ms);
    t.prompt_settle_ms = node["prompt_settle_ms"].as<int>(t.prompt_settle_ms);
    t.shell_settle_ms = node["shell_settle_ms"].as<int>(t.shell_settle_ms);
    t.inter_command_delay_ms = node["inter_command_delay_ms"].as<int>(t.inter_command_delay_ms);
    t.connect_timeout_secs = node["connect_timeout_secs"].as<int>(t.connect_timeout_secs);
    return t;
}

static RetryConfig parse_retry_config(const YAML::Node& node) {
    RetryConfig r;
    r.retries = node["retries"].as<int>(r.retries);
    r.retry_delay_ms = node["retry_delay_ms"].as<int>(r.retry_delay_ms);
    r.reconnect_delay_ms = node["reconnect_delay_ms"].as<int>(r.reconnect_delay_ms);
    return r;
}

static PromptConfig parse_prompt_config(const YAML::Node& node) {
    PromptConfig p;
    p.max_length = node["max_length"].as<int>(p.max_length);
    p.probe_command = node["probe_command"].as<std::string>(p.probe_command);
    p.expected_prompt = node["expected_prompt"].as<std::string>(p.expected_prompt);
    p.expected_prompt_count = node["expected_prompt_count"].as<int>(p.expected_prompt_count);
    return p;
}

static ExtractionConfig parse_extraction_config(const YAML::Node& node) {
    ExtractionConfig e;
    e.ip_context_window = node["ip_context_window"].as<int>(e.ip_context_window);
    e.max_ip_addresses = node["max_ip_addresses"].as<int>(e.max_ip_addresses);

    // A string or a list of strings
    const YAML::Node terms = node["ip_context_terms"];
    if (terms && terms.IsSequence()) {
        e.ip_context_terms.clear();
        for (const auto& t : terms) {
            e.ip_context_terms.push_back(t.as<std::string>());
        }
    } else if (terms && terms.IsScalar()) {
        e.ip_context_terms = {terms.as<std::string>()};
    }
    return e;
}

static Result<void> validate(const ProbeConfig& c) {
    if (c.timing.poll_interval_ms <= 0)
        return Result<void>::Err("timing.poll_interval_ms must be positive");
    if (c.timing.command_timeout_ms <= 0)
        return Result<void>::Err("timing.command_timeout_ms must be positive");
    if (c.timing.quiescence_ms < 0 || c.timing.min_wait_ms < 0 || c.timing.inter_command_delay_ms < 0)
        return Result<void>::Err("timing windows must not be negative");
    if (c.retry.retries < 0)
        return Result<void>::Err("retry.retries must not be negative");
    if (c.prompt.max_length <= 0)
        return Result<void>::Err("prompt.max_length must be positive");
    if (c.prompt.expected_prompt_count < 1)
        return Result<void>::Err("prompt.expected_prompt_count must be at least 1");
    if (c.extraction.ip_context_window < 0 || c.extraction.max_ip_addresses < 0)
        return Result<void>::Err("extraction limits must not be negative");
    return Result<void>::Ok();
}

Result<Config> Config::parse(const std::string& yaml_text) {
    Config config;
    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (root.IsNull()) {
            return Result<Config>::Ok(config);
        }
        if (!root.IsMap()) {
            return Result<Config>::Err("Config root must be a mapping");
        }

        if (root["timing"]) config.probe_.timing = parse_timing_config(root["timing"]);
        if (root["retry"]) config.probe_.retry = parse_retry_config(root["retry"]);
        if (root["prompt"]) config.probe_.prompt = parse_prompt_config(root["prompt"]);
        if (root["extraction"]) config.probe_.extraction = parse_extraction_config(root["extraction"]);
        if (root["log_file"] && root["log_file"].IsScalar()) {
            config.probe_.log_file = root["log_file"].as<std::string>();
        }
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err("Invalid config: " + std::string(e.what()));
    }

    auto valid = validate(config.probe_);
    if (valid.is_err()) {
        return Result<Config>::Err("Invalid config: " + valid.error);
    }
    return Result<Config>::Ok(config);
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config file not found: " + path.string());
    }

    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Failed to open config file: " + path.string());
    }
    std::string text((std::istreambuf_iterator<char>(in)),
                     std::istreambuf_iterator<char>());

    auto result = parse(text);
    if (result.is_err()) {
        return Result<Config>::Err(path.string() + ": " + result.error);
    }
    return result;
}

Result<Config> Config::load_global() {
    if (!global_config_exists()) {
        return Result<Config>::Ok(Config{});
    }
    return load_file(get_global_config_path());
}

Result<Config> Config::load(const std::optional<fs::path>& path) {
    if (path) {
        return load_file(*path);
    }
    return load_global();
}

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

fs::path get_devprobe_dir() {
    return platform::home_dir() / DEVPROBE_DIR_NAME;
}

fs::path get_global_config_path() {
    return get_devprobe_dir() / CONFIG_FILE_NAME;
}

Result<void> create_default_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    const char* default_config = R"(# devprobe configuration
# Timing values are milliseconds unless the key says otherwise.

timing:
  poll_interval_ms: 50        # how often output is checked while waiting
  quiescence_ms: 300          # no new output for this long => command done
  min_wait_ms: 500            # never declare a command done sooner
  command_timeout_ms: 3000    # hard cap per command
  prompt_settle_ms: 1000      # wait after each prompt probe
  shell_settle_ms: 2000       # wait for banner/MOTD after the shell opens
  inter_command_delay_ms: 0   # pause between consecutive commands
  connect_timeout_secs: 30

retry:
  retries: 1                  # extra attempts per command
  retry_delay_ms: 1000
  reconnect_delay_ms: 1000

prompt:
  max_length: 50
  probe_command: "?"
  # expected_prompt: "router1#"   # skip discovery and wait for this exact text
  # expected_prompt_count: 1

extraction:
  ip_context_window: 50
  max_ip_addresses: 5
  ip_context_terms: ["ip address", "management", "vlan", "interface"]

# log_file: "/tmp/devprobe_debug.log"
)";

    try {
        fs::create_directories(config_path.parent_path());
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + config_path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}
