#pragma once

#include <string>
#include <core/types.hpp>
#include "completion_detector.hpp"
#include "shell_session.hpp"

// Runs one command on a session with bounded retries. Channel and
// connection failures, or a session that no longer answers is_alive(), get
// a reconnect before the next attempt; anything else just waits
// retry_delay_ms. Consecutive commands are spaced by inter_command_delay_ms.
// Never throws: the terminal failure is a
// CommandResult with status Failed.
class CommandRunner {
public:
    CommandRunner(ShellSession& session, const TimingConfig& timing, const RetryConfig& retry);

    CommandResult run(const std::string& command);

    // Counters for the most recent run()
    int last_attempts() const { return last_attempts_; }
    int last_reconnects() const { return last_reconnects_; }

private:
    ShellSession& session_;
    TimingConfig timing_;
    RetryConfig retry_;
    CompletionDetector detector_;
    int last_attempts_ = 0;
    int last_reconnects_ = 0;
    int commands_run_ = 0;
};

// Whether a failure should be answered with a reconnect.
bool is_channel_failure(ErrorKind kind, const std::string& message);
