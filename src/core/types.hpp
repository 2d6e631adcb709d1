#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <functional>
#include <cstdint>

// What layer an error came from. Channel/Connection failures are the ones
// worth a reconnect; Authentication never is.
enum class ErrorKind {
    None,
    Connection,
    Authentication,
    Channel,
    Timeout,
    Other,
};

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(const std::string& err, ErrorKind kind = ErrorKind::Other) {
        return {false, T{}, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(const std::string& err, ErrorKind kind = ErrorKind::Other) {
        return {false, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Outcome of one command sent to an interactive shell.
//   Complete - prompt seen or output went quiet
//   TimedOut - hard deadline hit; output is whatever arrived before it
//   Failed   - transport gave up after all retries; output may be partial
enum class CommandStatus {
    Complete,
    TimedOut,
    Failed,
};

struct CommandResult {
    CommandStatus status;
    std::string output;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    bool ok() const { return status != CommandStatus::Failed; }
    bool failed() const { return status == CommandStatus::Failed; }
    bool timed_out() const { return status == CommandStatus::TimedOut; }
};

// ── Configuration structures ────────────────────────────────

struct ProbeTarget {
    std::string host;
    int port = 22;
    std::string user;
    std::string password;
};

struct TimingConfig {
    int poll_interval_ms = 50;
    int quiescence_ms = 300;         // no growth for this long => done
    int min_wait_ms = 500;           // never declare done earlier than this
    int command_timeout_ms = 3000;   // hard cap per command
    int prompt_settle_ms = 1000;     // wait after a prompt probe
    int shell_settle_ms = 2000;      // wait for banner/MOTD after shell opens
    int inter_command_delay_ms = 0;  // pause before each command after the first
    int connect_timeout_secs = 30;
};

struct RetryConfig {
    int retries = 1;                 // total attempts = retries + 1
    int retry_delay_ms = 1000;
    int reconnect_delay_ms = 1000;
};

struct PromptConfig {
    int max_length = 50;             // longer candidates are treated as output
    std::string probe_command = "?";
    std::string expected_prompt;     // skips discovery when set; matched literally
    int expected_prompt_count = 1;   // prompt occurrences that end a command
};

struct ExtractionConfig {
    int ip_context_window = 50;      // chars either side of an IP token
    int max_ip_addresses = 5;
    std::vector<std::string> ip_context_terms{"ip address", "management", "vlan", "interface"};
};

struct ProbeConfig {
    TimingConfig timing;
    RetryConfig retry;
    PromptConfig prompt;
    ExtractionConfig extraction;
    std::optional<std::string> log_file;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
