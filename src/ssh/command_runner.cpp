#include "command_runner.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>

bool is_channel_failure(ErrorKind kind, const std::string& message) {
    if (kind == ErrorKind::Channel || kind == ErrorKind::Connection) return true;
    std::string lower = to_lower(message);
    return lower.find("channel") != std::string::npos ||
           lower.find("connection") != std::string::npos;
}

CommandRunner::CommandRunner(ShellSession& session, const TimingConfig& timing,
                             const RetryConfig& retry)
    : session_(session), timing_(timing), retry_(retry), detector_(session, timing) {
}

CommandResult CommandRunner::run(const std::string& command) {
    const int max_attempts = std::max(1, retry_.retries + 1);
    last_attempts_ = 0;
    last_reconnects_ = 0;

    if (commands_run_ > 0 && timing_.inter_command_delay_ms > 0) {
        probe_log(fmt::format("runner: waiting {}ms before '{}'", timing_.inter_command_delay_ms, command));
        session_.clock().sleep_for(Clock::duration(timing_.inter_command_delay_ms));
    }
    commands_run_++;

    std::string last_error;
    ErrorKind last_kind = ErrorKind::Other;
    std::string partial;

    for (int attempt = 1; attempt <= max_attempts; attempt++) {
        last_attempts_ = attempt;

        // Drain anything stale so it is not attributed to this command
        auto drained = session_.pump();
        if (drained.is_ok()) {
            size_t start = session_.buffer().size();
            auto sent_at = session_.clock().now();

            auto sent = session_.send(command + "\n");
            if (sent.is_ok()) {
                Completion c = detector_.wait(start, sent_at, session_.prompt(),
                                              session_.prompt_count());
                if (c.reason != CompletionReason::ChannelFailed) {
                    CommandStatus status = c.reason == CompletionReason::TimedOut
                        ? CommandStatus::TimedOut : CommandStatus::Complete;
                    return CommandResult{status, c.output, "", ErrorKind::None};
                }
                last_error = c.error;
                last_kind = c.kind;
                partial = c.output;
            } else {
                last_error = sent.error;
                last_kind = sent.kind;
            }
        } else {
            last_error = drained.error;
            last_kind = drained.kind;
        }

        probe_log(fmt::format("runner: '{}' attempt {}/{} failed [{}]: {}",
                              command, attempt, max_attempts, to_string(last_kind), last_error));

        if (attempt == max_attempts) break;

        // A shell that died quietly gets the same treatment as a reported channel error
        if (is_channel_failure(last_kind, last_error) || !session_.is_alive()) {
            last_reconnects_++;
            auto r = session_.reconnect(retry_.reconnect_delay_ms);
            if (r.is_err()) {
                probe_log("runner: reconnect failed: " + r.error);
                last_error = r.error;
                last_kind = r.kind;
            }
        } else {
            session_.clock().sleep_for(Clock::duration(retry_.retry_delay_ms));
        }
    }

    return CommandResult{CommandStatus::Failed, partial,
                         fmt::format("Max retries exceeded: {}", last_error), last_kind};
}
